#pragma once
#include "cm/drawing/Drawing.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace cm {

// Snapshot-based undo/redo for the committed drawing array.
// One snapshot per user action; a drag is one action.
struct DrawingSnapshot {
  std::string description;       // e.g. "create segment", "delete drawing"
  std::vector<Drawing> drawings; // array before the action
};

class DrawingHistory {
public:
  explicit DrawingHistory(std::size_t maxDepth = 50) : maxDepth_(maxDepth) {}

  // Record the array as it was before an action.
  // Clears the redo stack; drops the oldest snapshot past maxDepth.
  void push(std::string description, std::vector<Drawing> before);

  // Restore the previous array into `out`; `current` moves to the redo stack.
  // Returns false if there is nothing to undo.
  bool undo(const std::vector<Drawing>& current, std::vector<Drawing>& out);
  bool redo(const std::vector<Drawing>& current, std::vector<Drawing>& out);

  bool canUndo() const { return !undoStack_.empty(); }
  bool canRedo() const { return !redoStack_.empty(); }
  std::size_t undoCount() const { return undoStack_.size(); }
  std::size_t redoCount() const { return redoStack_.size(); }

  void setMaxDepth(std::size_t depth);
  std::size_t maxDepth() const { return maxDepth_; }

  void clear();

  // Empty string if the respective stack is empty.
  const std::string& undoDescription() const;
  const std::string& redoDescription() const;

private:
  void trim();

  std::vector<DrawingSnapshot> undoStack_;
  std::vector<DrawingSnapshot> redoStack_;
  std::size_t maxDepth_;
  static const std::string empty_;
};

} // namespace cm
