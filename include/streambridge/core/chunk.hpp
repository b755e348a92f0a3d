#pragma once

/**
 * @file
 * @brief Immutable byte chunk moved through the handoff queue.
 */

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace streambridge {

/**
 * @brief Owned, immutable byte sequence; the unit of transfer.
 *
 * A default-constructed (empty) chunk doubles as the poison value inserted
 * at shutdown. Writers never enqueue empty chunks.
 */
class chunk {
public:
    /// Construct the empty chunk.
    chunk() noexcept = default;
    /// Take ownership of a byte vector.
    explicit chunk(std::vector<std::byte> bytes) noexcept
        : bytes_(std::move(bytes)) {}

    /// @brief Copy bytes out of a caller-owned buffer.
    [[nodiscard]] static chunk copy_of(std::span<const std::byte> bytes) {
        return chunk{std::vector<std::byte>(bytes.begin(), bytes.end())};
    }

    /// @return View over the chunk content.
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
        return bytes_;
    }
    /// @return Number of bytes.
    [[nodiscard]] std::size_t size() const noexcept {
        return bytes_.size();
    }
    /// @return `true` for the empty (poison) chunk.
    [[nodiscard]] bool empty() const noexcept {
        return bytes_.empty();
    }

    /// @brief Move the content out, leaving this chunk empty.
    [[nodiscard]] std::vector<std::byte> release() && noexcept {
        return std::exchange(bytes_, {});
    }

    friend bool operator==(const chunk&, const chunk&) = default;

private:
    std::vector<std::byte> bytes_{};
};

} // namespace streambridge
