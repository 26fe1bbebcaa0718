#pragma once

#include "history/HistoryAction.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace conngraph {
namespace history {

/**
 * Undo/redo stacks of graph mutations.
 *
 * Only actions that applied successfully are recorded; recording a new
 * action drops the redo stack. Actions are never merged.
 */
class HistoryLog {
public:
    explicit HistoryLog(EdgeStore& store);

    HistoryLog(const HistoryLog&) = delete;
    HistoryLog& operator=(const HistoryLog&) = delete;

    /**
     * Apply the action and record it. False (nothing recorded) if it
     * could not be applied.
     */
    bool execute(std::unique_ptr<HistoryAction> action);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    bool undo();
    bool redo();

    size_t undoCount() const { return m_undo.size(); }
    size_t redoCount() const { return m_redo.size(); }

    /**
     * Name of the action undo() would revert, empty when none
     */
    std::string undoName() const;
    std::string redoName() const;

    void clear();

    void setChangeCallback(std::function<void()> callback) { m_onChange = std::move(callback); }

private:
    void notify();

    EdgeStore& m_store;
    std::vector<std::unique_ptr<HistoryAction>> m_undo;
    std::vector<std::unique_ptr<HistoryAction>> m_redo;
    std::function<void()> m_onChange;
};

} // namespace history
} // namespace conngraph
