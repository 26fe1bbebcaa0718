#include <catch2/catch.hpp>
#include "history/EdgeActions.hpp"
#include "history/HistoryLog.hpp"
#include <algorithm>
#include <memory>

using namespace conngraph;
using namespace conngraph::history;
using graph::Edge;
using graph::EdgePolicy;
using graph::EdgePtr;
using graph::Node;
using graph::Port;

namespace {

// Minimal edge store: plain vector, single-use ports toggled like the engine does
class VectorStore : public EdgeStore {
public:
    size_t edgeCount() const override { return edges.size(); }

    bool insertEdge(const EdgePtr& edge, size_t position) override {
        if (std::find(edges.begin(), edges.end(), edge) != edges.end()) return false;
        if (edge->policy() == EdgePolicy::SingleUse) {
            edge->start()->setAvailable(false);
            edge->end()->setAvailable(false);
        }
        position = std::min(position, edges.size());
        edges.insert(edges.begin() + static_cast<std::ptrdiff_t>(position), edge);
        return true;
    }

    std::optional<size_t> removeEdge(const Edge& edge) override {
        for (size_t i = 0; i < edges.size(); ++i) {
            if (edges[i].get() == &edge) {
                if (edge.policy() == EdgePolicy::SingleUse) {
                    edge.start()->setAvailable(true);
                    edge.end()->setAvailable(true);
                }
                edges.erase(edges.begin() + static_cast<std::ptrdiff_t>(i));
                return i;
            }
        }
        return std::nullopt;
    }

    bool rebindEdge(Edge& edge, Port* start, Port* end) override {
        if (edge.policy() == EdgePolicy::SingleUse) {
            edge.start()->setAvailable(true);
            edge.end()->setAvailable(true);
            start->setAvailable(false);
            end->setAvailable(false);
        }
        edge.setEndpoints(start, end);
        return true;
    }

    graph::EdgeList edges;
};

// Action that refuses to apply
class RefusingAction : public HistoryAction {
public:
    std::string name() const override { return "Refuse"; }
    bool apply(EdgeStore&) override { return false; }
    bool revert(EdgeStore&) override { return true; }
};

class HistoryFixture {
public:
    HistoryFixture()
        : a("a", graph::NodeKind::Action, true)
        , b("b", graph::NodeKind::Action, true)
        , c("c", graph::NodeKind::Action, true)
        , log(store)
    {
        a.addOutput("string");
        b.addInput("string");
        c.addInput("string", std::string("row-c"));
    }

    EdgePtr edgeAB(EdgePolicy policy = EdgePolicy::SingleUse) {
        return std::make_shared<Edge>(a.output(0), b.input(0), policy);
    }

    Node a;
    Node b;
    Node c;
    VectorStore store;
    HistoryLog log;
};

} // namespace

TEST_CASE("Executed connect can be undone and redone", "[HistoryLog]") {
    HistoryFixture f;
    auto edge = f.edgeAB();

    REQUIRE(f.log.execute(std::make_unique<ConnectAction>(edge)));
    REQUIRE(f.store.edges.size() == 1);
    REQUIRE_FALSE(f.a.output(0)->isAvailable());
    REQUIRE(f.log.canUndo());
    REQUIRE(f.log.undoName() == "Connect");

    REQUIRE(f.log.undo());
    REQUIRE(f.store.edges.empty());
    REQUIRE(f.a.output(0)->isAvailable());
    REQUIRE(f.b.input(0)->isAvailable());
    REQUIRE(f.log.canRedo());

    REQUIRE(f.log.redo());
    REQUIRE(f.store.edges.size() == 1);
    REQUIRE(f.store.edges[0] == edge);
    REQUIRE_FALSE(f.b.input(0)->isAvailable());
}

TEST_CASE("Undo of a disconnect restores the edge and its metadata", "[HistoryLog]") {
    HistoryFixture f;
    auto edge = f.edgeAB();
    f.log.execute(std::make_unique<ConnectAction>(edge));
    edge->labels.middle = "feeds";
    edge->markStatus(graph::EdgeStatus::Warning, graph::colors::Amber);

    REQUIRE(f.log.execute(std::make_unique<DisconnectAction>(edge)));
    REQUIRE(f.store.edges.empty());

    REQUIRE(f.log.undo());
    REQUIRE(f.store.edges.size() == 1);
    REQUIRE(f.store.edges[0]->labels.middle == "feeds");
    REQUIRE(f.store.edges[0]->status == graph::EdgeStatus::Warning);
    REQUIRE_FALSE(f.a.output(0)->isAvailable());
}

TEST_CASE("Undo of a move restores endpoints and row ids", "[HistoryLog]") {
    HistoryFixture f;
    auto edge = f.edgeAB();
    f.log.execute(std::make_unique<ConnectAction>(edge));

    REQUIRE(f.log.execute(std::make_unique<MoveEdgeAction>(edge, edge->start(), f.c.input(0))));
    REQUIRE(&edge->targetNode() == &f.c);
    REQUIRE(edge->targetRowId == std::string("row-c"));
    REQUIRE(f.b.input(0)->isAvailable());
    REQUIRE_FALSE(f.c.input(0)->isAvailable());

    REQUIRE(f.log.undo());
    REQUIRE(&edge->targetNode() == &f.b);
    REQUIRE_FALSE(edge->targetRowId.has_value());
    REQUIRE_FALSE(f.b.input(0)->isAvailable());
    REQUIRE(f.c.input(0)->isAvailable());
}

TEST_CASE("New action clears the redo stack", "[HistoryLog]") {
    HistoryFixture f;
    auto edge = f.edgeAB(EdgePolicy::Shared);
    f.log.execute(std::make_unique<ConnectAction>(edge));
    f.log.undo();
    REQUIRE(f.log.redoCount() == 1);

    f.log.execute(std::make_unique<ConnectAction>(f.edgeAB(EdgePolicy::Shared)));

    REQUIRE(f.log.redoCount() == 0);
    REQUIRE_FALSE(f.log.redo());
}

TEST_CASE("Actions that fail to apply are not recorded", "[HistoryLog]") {
    HistoryFixture f;

    REQUIRE_FALSE(f.log.execute(std::make_unique<RefusingAction>()));
    REQUIRE_FALSE(f.log.execute(nullptr));
    REQUIRE(f.log.undoCount() == 0);
}

TEST_CASE("Undo and redo on empty stacks do nothing", "[HistoryLog]") {
    HistoryFixture f;

    REQUIRE_FALSE(f.log.undo());
    REQUIRE_FALSE(f.log.redo());
    REQUIRE(f.log.undoName().empty());
}

TEST_CASE("Change callback fires on every history change", "[HistoryLog]") {
    HistoryFixture f;
    int changes = 0;
    f.log.setChangeCallback([&changes]() { ++changes; });

    f.log.execute(std::make_unique<ConnectAction>(f.edgeAB()));
    f.log.undo();
    f.log.redo();
    f.log.clear();

    REQUIRE(changes == 4);
    REQUIRE_FALSE(f.log.canUndo());
    REQUIRE_FALSE(f.log.canRedo());
}
