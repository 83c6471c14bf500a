#pragma once

#include <cstddef>

namespace jnav {

/// Contiguous slice [begin, end) of the flattened rows that is on screen.
struct ViewWindow {
  size_t begin = 0;
  size_t end = 0;
  size_t cursor = 0;
};

/// Keeps a logical cursor row and a scroll offset over `row_count` rows.
/// MUST keep the cursor inside the window and shift the offset by the minimum
/// amount when the cursor would leave it.
class ViewProjector {
 public:
  ViewProjector() = default;
  explicit ViewProjector(size_t capacity);

  /// Replaces the row count after a rebuild or fold change.
  /// The cursor is clamped to the last row; the offset is re-clamped.
  void set_row_count(size_t rows);
  /// Changes the row capacity, preserving the cursor row when it is still valid.
  void resize(size_t capacity);
  /// Puts cursor and offset back on the first row.
  void reset();

  /// Moves the cursor to `row` (clamped), scrolling minimally.
  void set_cursor(size_t row);
  bool up();
  bool down();
  void head();
  void tail();

  ViewWindow window() const;
  size_t cursor() const { return cursor_; }
  size_t offset() const { return offset_; }
  size_t capacity() const { return capacity_; }
  size_t row_count() const { return row_count_; }

 private:
  void clamp();

  size_t capacity_ = 1;
  size_t row_count_ = 0;
  size_t offset_ = 0;
  size_t cursor_ = 0;
};

}  // namespace jnav
