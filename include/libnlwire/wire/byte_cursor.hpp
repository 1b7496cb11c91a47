/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_BYTE_CURSOR_HPP_INCLUDED
#define LIBNLWIRE_WIRE_BYTE_CURSOR_HPP_INCLUDED

#include "errors.hpp"
#include "libnlwire/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace libnlwire
{
namespace wire
{

/// @brief Defines byte order of a multibyte primitive value.
///
/// Netlink header fields are in the host byte order, but some attribute payloads
/// declare the network (big endian) order (see `AttributeFlags::NetByteOrder`).
///
enum class ByteOrder : std::uint8_t
{
    Host,
    Big,
    Little,
    Network = Big,
};

/// Internal implementation details.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

constexpr std::size_t BitsPerByte = 8U;

template <typename T>
T loadUnsigned(const cetl::byte* const src, const ByteOrder order) noexcept
{
    static_assert(std::is_unsigned<T>::value, "Only unsigned integers are supported.");

    T value = 0;
    switch (order)
    {
    case ByteOrder::Big:
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            value = static_cast<T>((value << BitsPerByte) | static_cast<T>(src[i]));  // NOLINT
        }
        break;
    case ByteOrder::Little:
        for (std::size_t i = sizeof(T); i > 0; --i)
        {
            value = static_cast<T>((value << BitsPerByte) | static_cast<T>(src[i - 1]));  // NOLINT
        }
        break;
    default:
        (void) std::memcpy(&value, src, sizeof(T));
        break;
    }
    return value;
}

template <typename T>
void storeUnsigned(const T value, cetl::byte* const dst, const ByteOrder order) noexcept
{
    static_assert(std::is_unsigned<T>::value, "Only unsigned integers are supported.");

    switch (order)
    {
    case ByteOrder::Big:
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            const std::size_t shift = BitsPerByte * (sizeof(T) - 1U - i);
            dst[i] = static_cast<cetl::byte>(static_cast<std::uint8_t>(value >> shift));  // NOLINT
        }
        break;
    case ByteOrder::Little:
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            dst[i] = static_cast<cetl::byte>(static_cast<std::uint8_t>(value >> (BitsPerByte * i)));  // NOLINT
        }
        break;
    default:
        (void) std::memcpy(dst, &value, sizeof(T));
        break;
    }
}

/// @brief Calculates number of bytes needed to advance `position` to the next multiple of `alignment`,
/// where the alignment is counted from the `base` position.
///
constexpr std::size_t paddingOf(const std::size_t position,
                                const std::size_t alignment,
                                const std::size_t base) noexcept
{
    return (alignment == 0) ? 0 : ((alignment - ((position - base) % alignment)) % alignment);
}

}  // namespace detail

/// @brief Defines a bounds-checked reading view over immutable bytes.
///
/// The cursor does not own the bytes; the viewed buffer must outlive the cursor
/// (and any spans which were returned by `readBytes`).
///
class ReadCursor final
{
public:
    explicit ReadCursor(const ConstBytesSpan buffer) noexcept
        : buffer_{buffer}
        , position_{0}
    {
    }

    /// @brief Gets current position of the cursor (counted from the beginning of the whole buffer).
    ///
    std::size_t position() const noexcept
    {
        return position_;
    }

    /// @brief Gets number of bytes left between the current position and the end of the buffer.
    ///
    std::size_t remaining() const noexcept
    {
        return buffer_.size() - position_;
    }

    std::size_t size() const noexcept
    {
        return buffer_.size();
    }

    CETL_NODISCARD Expected<std::uint8_t, OutOfBoundsError> readU8()
    {
        return readUnsigned<std::uint8_t>(ByteOrder::Host);
    }

    CETL_NODISCARD Expected<std::uint16_t, OutOfBoundsError> readU16(const ByteOrder order = ByteOrder::Host)
    {
        return readUnsigned<std::uint16_t>(order);
    }

    CETL_NODISCARD Expected<std::uint32_t, OutOfBoundsError> readU32(const ByteOrder order = ByteOrder::Host)
    {
        return readUnsigned<std::uint32_t>(order);
    }

    CETL_NODISCARD Expected<std::uint64_t, OutOfBoundsError> readU64(const ByteOrder order = ByteOrder::Host)
    {
        return readUnsigned<std::uint64_t>(order);
    }

    /// @brief Reads (borrows) the next `count` bytes.
    ///
    /// On failure the cursor position stays unchanged.
    ///
    /// @return A view of the bytes within the original buffer, or `OutOfBoundsError`.
    ///
    CETL_NODISCARD Expected<ConstBytesSpan, OutOfBoundsError> readBytes(const std::size_t count)
    {
        if (count > remaining())
        {
            return OutOfBoundsError{position_, count, remaining()};
        }
        const auto bytes = buffer_.subspan(position_, count);
        position_ += count;
        return bytes;
    }

    /// @brief Advances the cursor by `count` bytes without looking at them.
    ///
    CETL_NODISCARD cetl::optional<OutOfBoundsError> skip(const std::size_t count)
    {
        if (count > remaining())
        {
            return OutOfBoundsError{position_, count, remaining()};
        }
        position_ += count;
        return cetl::nullopt;
    }

    /// @brief Advances the cursor to the next multiple of `alignment` (counted from the `base` position).
    ///
    /// Skipped (padding) bytes are not required to be zero. The cursor never goes past the `limit`
    /// position (nor past the end of the buffer), so it is safe to use at the very end of a buffer
    /// where the last padding was omitted by the sender.
    ///
    void alignTo(const std::size_t alignment, const std::size_t base = 0, const std::size_t limit = SIZE_MAX) noexcept
    {
        CETL_DEBUG_ASSERT(base <= position_, "");

        const std::size_t end     = (limit < buffer_.size()) ? limit : buffer_.size();
        const std::size_t aligned = position_ + detail::paddingOf(position_, alignment, base);
        position_                 = (aligned < end) ? aligned : ((position_ < end) ? end : position_);
    }

private:
    template <typename T>
    CETL_NODISCARD Expected<T, OutOfBoundsError> readUnsigned(const ByteOrder order)
    {
        auto bytes_result = readBytes(sizeof(T));
        if (const auto* const failure = cetl::get_if<OutOfBoundsError>(&bytes_result))
        {
            return *failure;
        }
        return detail::loadUnsigned<T>(cetl::get<ConstBytesSpan>(bytes_result).data(), order);
    }

    // MARK: Data members:

    const ConstBytesSpan buffer_;
    std::size_t          position_;

};  // ReadCursor

// MARK: -

/// @brief Defines a bounds-checked writing cursor which appends to a byte buffer.
///
/// Every write which would grow the buffer beyond the caller-specified `capacity` fails
/// with `BufferFullError`, and leaves the buffer unchanged - nothing is silently truncated.
///
/// Length fields (which are known only after the body is serialized) are supported by
/// `reserve`-ing a region first, and `patchU16`/`patchU32` it later at the recorded offset.
///
class WriteCursor final
{
public:
    WriteCursor(Bytes& buffer, const std::size_t capacity) noexcept
        : buffer_{buffer}
        , capacity_{capacity}
    {
        CETL_DEBUG_ASSERT(buffer.size() <= capacity, "");
    }

    WriteCursor(const WriteCursor&)                = delete;
    WriteCursor(WriteCursor&&) noexcept            = delete;
    WriteCursor& operator=(const WriteCursor&)     = delete;
    WriteCursor& operator=(WriteCursor&&) noexcept = delete;

    ~WriteCursor() = default;

    std::size_t position() const noexcept
    {
        return buffer_.size();
    }

    std::size_t remaining() const noexcept
    {
        return capacity_ - buffer_.size();
    }

    std::size_t capacity() const noexcept
    {
        return capacity_;
    }

    CETL_NODISCARD cetl::optional<BufferFullError> writeU8(const std::uint8_t value)
    {
        return writeUnsigned(value, ByteOrder::Host);
    }

    CETL_NODISCARD cetl::optional<BufferFullError> writeU16(const std::uint16_t value,
                                                            const ByteOrder     order = ByteOrder::Host)
    {
        return writeUnsigned(value, order);
    }

    CETL_NODISCARD cetl::optional<BufferFullError> writeU32(const std::uint32_t value,
                                                            const ByteOrder     order = ByteOrder::Host)
    {
        return writeUnsigned(value, order);
    }

    CETL_NODISCARD cetl::optional<BufferFullError> writeU64(const std::uint64_t value,
                                                            const ByteOrder     order = ByteOrder::Host)
    {
        return writeUnsigned(value, order);
    }

    CETL_NODISCARD cetl::optional<BufferFullError> writeBytes(const ConstBytesSpan bytes)
    {
        if (bytes.size() > remaining())
        {
            return BufferFullError{capacity_, bytes.size()};
        }
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
        return cetl::nullopt;
    }

    CETL_NODISCARD cetl::optional<BufferFullError> writeZeros(const std::size_t count)
    {
        if (count > remaining())
        {
            return BufferFullError{capacity_, count};
        }
        buffer_.insert(buffer_.end(), count, cetl::byte{0});
        return cetl::nullopt;
    }

    /// @brief Reserves (zero-filled) region of `count` bytes to be patched later.
    ///
    /// @return Offset of the reserved region, or `BufferFullError`.
    ///
    CETL_NODISCARD Expected<std::size_t, BufferFullError> reserve(const std::size_t count)
    {
        const std::size_t offset = position();
        if (auto failure = writeZeros(count))
        {
            return *failure;
        }
        return offset;
    }

    void patchU16(const std::size_t offset, const std::uint16_t value, const ByteOrder order = ByteOrder::Host)
    {
        patchUnsigned(offset, value, order);
    }

    void patchU32(const std::size_t offset, const std::uint32_t value, const ByteOrder order = ByteOrder::Host)
    {
        patchUnsigned(offset, value, order);
    }

    /// @brief Emits zero bytes up to the next multiple of `alignment` (counted from the `base` position).
    ///
    CETL_NODISCARD cetl::optional<BufferFullError> alignTo(const std::size_t alignment, const std::size_t base = 0)
    {
        CETL_DEBUG_ASSERT(base <= position(), "");

        return writeZeros(detail::paddingOf(position(), alignment, base));
    }

private:
    template <typename T>
    CETL_NODISCARD cetl::optional<BufferFullError> writeUnsigned(const T value, const ByteOrder order)
    {
        std::array<cetl::byte, sizeof(T)> bytes{};
        detail::storeUnsigned(value, bytes.data(), order);
        return writeBytes({bytes.data(), bytes.size()});
    }

    template <typename T>
    void patchUnsigned(const std::size_t offset, const T value, const ByteOrder order)
    {
        CETL_DEBUG_ASSERT(offset + sizeof(T) <= buffer_.size(), "Patching is allowed only within written region.");

        detail::storeUnsigned(value, &buffer_[offset], order);
    }

    // MARK: Data members:

    Bytes&            buffer_;
    const std::size_t capacity_;

};  // WriteCursor

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_BYTE_CURSOR_HPP_INCLUDED
