#pragma once

#include <cstddef>
#include <kara/timeline.hpp>
#include <string>
#include <vector>

namespace kara
{

// A full deep copy of the model taken before a structural edit.
struct Snapshot
{
    std::string   description;   // e.g. "Split line"
    AnimationData data;
};

// Linear undo/redo over whole-model snapshots.
// push() stores the state *before* an edit and drops all redo entries.
// undo()/redo() swap the live model with the neighbouring snapshot, so an
// undo is never recorded as an edit of its own.
// Capped at `capacity` undo entries; the oldest is dropped first.
class SnapshotHistory
{
   public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit SnapshotHistory(size_t capacity = DEFAULT_CAPACITY);

    void push(std::string description, const AnimationData& before);

    // Restore the previous snapshot into `live`. Returns false if none.
    bool undo(AnimationData& live);

    // Re-apply the state left by the last undo. Returns false if none.
    bool redo(AnimationData& live);

    bool can_undo() const { return !undo_stack_.empty(); }
    bool can_redo() const { return !redo_stack_.empty(); }

    std::string undo_description() const;
    std::string redo_description() const;

    size_t undo_count() const { return undo_stack_.size(); }
    size_t redo_count() const { return redo_stack_.size(); }
    size_t capacity() const { return capacity_; }

    void clear();

   private:
    size_t                capacity_;
    std::vector<Snapshot> undo_stack_;
    std::vector<Snapshot> redo_stack_;
};

}   // namespace kara
