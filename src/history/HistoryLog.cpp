#include "history/HistoryLog.hpp"
#include "util/Logger.hpp"

namespace conngraph {
namespace history {

HistoryLog::HistoryLog(EdgeStore& store)
    : m_store(store)
{
}

bool HistoryLog::execute(std::unique_ptr<HistoryAction> action) {
    if (!action) return false;

    if (!action->apply(m_store)) {
        CG_LOG_DEBUG("History: " + action->name() + " could not be applied");
        return false;
    }

    m_undo.emplace_back(std::move(action));
    m_redo.clear();
    notify();
    return true;
}

bool HistoryLog::canUndo() const noexcept { return !m_undo.empty(); }
bool HistoryLog::canRedo() const noexcept { return !m_redo.empty(); }

bool HistoryLog::undo() {
    if (m_undo.empty()) return false;

    auto action = std::move(m_undo.back());
    m_undo.pop_back();

    if (!action->revert(m_store)) {
        CG_LOG_WARN("History: undo of " + action->name() + " failed, action dropped");
        notify();
        return false;
    }

    m_redo.emplace_back(std::move(action));
    notify();
    return true;
}

bool HistoryLog::redo() {
    if (m_redo.empty()) return false;

    auto action = std::move(m_redo.back());
    m_redo.pop_back();

    if (!action->apply(m_store)) {
        CG_LOG_WARN("History: redo of " + action->name() + " failed, action dropped");
        notify();
        return false;
    }

    m_undo.emplace_back(std::move(action));
    notify();
    return true;
}

std::string HistoryLog::undoName() const {
    return m_undo.empty() ? std::string() : m_undo.back()->name();
}

std::string HistoryLog::redoName() const {
    return m_redo.empty() ? std::string() : m_redo.back()->name();
}

void HistoryLog::clear() {
    m_undo.clear();
    m_redo.clear();
    notify();
}

void HistoryLog::notify() {
    if (m_onChange) {
        m_onChange();
    }
}

} // namespace history
} // namespace conngraph
