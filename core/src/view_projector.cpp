#include "jnav/view_projector.h"

#include <algorithm>

namespace jnav {

ViewProjector::ViewProjector(size_t capacity) : capacity_(capacity) {}

void ViewProjector::set_row_count(size_t rows) {
  row_count_ = rows;
  clamp();
}

void ViewProjector::resize(size_t capacity) {
  capacity_ = capacity;
  clamp();
}

void ViewProjector::reset() {
  cursor_ = 0;
  offset_ = 0;
}

void ViewProjector::set_cursor(size_t row) {
  cursor_ = row;
  clamp();
}

bool ViewProjector::up() {
  if (cursor_ == 0) return false;
  --cursor_;
  if (cursor_ < offset_) offset_ = cursor_;
  return true;
}

bool ViewProjector::down() {
  if (cursor_ + 1 >= row_count_) return false;
  ++cursor_;
  if (capacity_ > 0 && cursor_ >= offset_ + capacity_) offset_ = cursor_ + 1 - capacity_;
  return true;
}

void ViewProjector::head() {
  cursor_ = 0;
  offset_ = 0;
}

void ViewProjector::tail() {
  if (row_count_ == 0) return;
  cursor_ = row_count_ - 1;
  offset_ = (capacity_ > 0 && row_count_ > capacity_) ? row_count_ - capacity_ : 0;
}

ViewWindow ViewProjector::window() const {
  ViewWindow out;
  out.begin = std::min(offset_, row_count_);
  out.end = std::min(row_count_, out.begin + capacity_);
  out.cursor = cursor_;
  return out;
}

void ViewProjector::clamp() {
  if (row_count_ == 0) {
    cursor_ = 0;
    offset_ = 0;
    return;
  }
  if (cursor_ >= row_count_) cursor_ = row_count_ - 1;
  if (capacity_ == 0) {
    offset_ = cursor_;
    return;
  }
  // Never leave blank rows below the data when the window could be filled.
  size_t max_offset = row_count_ > capacity_ ? row_count_ - capacity_ : 0;
  if (offset_ > max_offset) offset_ = max_offset;
  if (cursor_ < offset_) offset_ = cursor_;
  if (cursor_ >= offset_ + capacity_) offset_ = cursor_ + 1 - capacity_;
}

}  // namespace jnav
