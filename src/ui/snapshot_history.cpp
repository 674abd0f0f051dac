#include "snapshot_history.hpp"

#include <algorithm>
#include <kara/logger.hpp>

namespace kara
{

SnapshotHistory::SnapshotHistory(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

// ─── Push ────────────────────────────────────────────────────────────────────

void SnapshotHistory::push(std::string description, const AnimationData& before)
{
    redo_stack_.clear();
    undo_stack_.push_back({std::move(description), before});

    if (undo_stack_.size() > capacity_)
    {
        undo_stack_.erase(undo_stack_.begin());
        KARA_LOG_TRACE("history", "dropped oldest snapshot (capacity {})", capacity_);
    }
}

// ─── Undo / Redo ─────────────────────────────────────────────────────────────

bool SnapshotHistory::undo(AnimationData& live)
{
    if (undo_stack_.empty())
        return false;

    Snapshot snapshot = std::move(undo_stack_.back());
    undo_stack_.pop_back();

    redo_stack_.push_back({snapshot.description, std::move(live)});
    live = std::move(snapshot.data);
    return true;
}

bool SnapshotHistory::redo(AnimationData& live)
{
    if (redo_stack_.empty())
        return false;

    Snapshot snapshot = std::move(redo_stack_.back());
    redo_stack_.pop_back();

    undo_stack_.push_back({snapshot.description, std::move(live)});
    live = std::move(snapshot.data);
    return true;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::string SnapshotHistory::undo_description() const
{
    return undo_stack_.empty() ? "" : undo_stack_.back().description;
}

std::string SnapshotHistory::redo_description() const
{
    return redo_stack_.empty() ? "" : redo_stack_.back().description;
}

void SnapshotHistory::clear()
{
    undo_stack_.clear();
    redo_stack_.clear();
}

}   // namespace kara
