#include "cm/drawing/DrawingHistory.hpp"

namespace cm {

const std::string DrawingHistory::empty_;

void DrawingHistory::push(std::string description, std::vector<Drawing> before) {
  undoStack_.push_back(DrawingSnapshot{std::move(description), std::move(before)});
  redoStack_.clear();
  trim();
}

bool DrawingHistory::undo(const std::vector<Drawing>& current, std::vector<Drawing>& out) {
  if (undoStack_.empty()) return false;
  DrawingSnapshot snap = std::move(undoStack_.back());
  undoStack_.pop_back();
  redoStack_.push_back(DrawingSnapshot{snap.description, current});
  out = std::move(snap.drawings);
  return true;
}

bool DrawingHistory::redo(const std::vector<Drawing>& current, std::vector<Drawing>& out) {
  if (redoStack_.empty()) return false;
  DrawingSnapshot snap = std::move(redoStack_.back());
  redoStack_.pop_back();
  undoStack_.push_back(DrawingSnapshot{snap.description, current});
  out = std::move(snap.drawings);
  return true;
}

void DrawingHistory::setMaxDepth(std::size_t depth) {
  maxDepth_ = depth;
  trim();
}

void DrawingHistory::clear() {
  undoStack_.clear();
  redoStack_.clear();
}

const std::string& DrawingHistory::undoDescription() const {
  return undoStack_.empty() ? empty_ : undoStack_.back().description;
}

const std::string& DrawingHistory::redoDescription() const {
  return redoStack_.empty() ? empty_ : redoStack_.back().description;
}

void DrawingHistory::trim() {
  if (maxDepth_ == 0) {
    undoStack_.clear();
    return;
  }
  if (undoStack_.size() > maxDepth_) {
    undoStack_.erase(undoStack_.begin(),
                     undoStack_.begin() + static_cast<std::ptrdiff_t>(undoStack_.size() - maxDepth_));
  }
}

} // namespace cm
