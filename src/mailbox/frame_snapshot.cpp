#include "frame_snapshot.hpp"

namespace mailbox {

Rectangle GridLayout::cell_rect(int col, int row) const noexcept {
    const float block = cell_size + cell_spacing;
    return Rectangle{origin_x + col * block, origin_y + row * block, cell_size,
                     cell_size};
}

const BrickView *FrameSnapshot::brick_at(int col, int row) const noexcept {
    for (const auto &brick : bricks) {
        if (brick.col == col && brick.row == row)
            return &brick;
    }
    return nullptr;
}

int FrameSnapshot::remaining_strength() const noexcept {
    int sum = 0;
    for (const auto &brick : bricks) {
        sum += brick.strength;
    }
    return sum;
}

} // namespace mailbox
