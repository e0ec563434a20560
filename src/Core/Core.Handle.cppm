module;
#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <ostream>
#include <string>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle template
    // -------------------------------------------------------------------------
    // The Tag type parameter keeps handles of different entity kinds apart at
    // compile time:
    //
    //   struct VertexTag {};
    //   using VertexHandle = Core::StrongHandle<VertexTag>;
    //
    //   struct FaceTag {};
    //   using FaceHandle = Core::StrongHandle<FaceTag>;
    //
    //   VertexHandle v = vertices.Allocate(...);
    //   // FaceHandle f = v; // Compile error - different types!
    //
    // The Generation distinguishes successive occupants of a recycled slot, so a
    // handle that outlived its record is detected instead of aliasing a new one.
    // Generation 0 is never handed out by a store.
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        auto operator<=>(const StrongHandle&) const = default;
    };

    template <typename Tag>
    std::ostream& operator<<(std::ostream& os, StrongHandle<Tag> h)
    {
        if (!h.IsValid()) return os << "<invalid>";
        return os << h.Index << '#' << h.Generation;
    }
}

// Allow StrongHandle to be used in unordered containers
namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            // Pack into 64-bit integer (assuming 32-bit index/gen)
            uint64_t val = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;

            // MurmurHash3 Mix / WyHash Mix (Very fast, high avalanche)
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };

    // Log-friendly formatting: "index#generation".
    template <typename Tag>
    struct formatter<Core::StrongHandle<Tag>> : formatter<std::string>
    {
        auto format(const Core::StrongHandle<Tag>& h, format_context& ctx) const
        {
            if (!h.IsValid()) return formatter<std::string>::format("<invalid>", ctx);
            return formatter<std::string>::format(std::format("{}#{}", h.Index, h.Generation), ctx);
        }
    };
}
