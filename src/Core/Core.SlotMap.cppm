module;

#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

export module Core:SlotMap;
import :Error;

export namespace Core
{
    // Concept to ensure the Handle type carries an index and a generation tag
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
        H{uint32_t{}, uint32_t{}};
    };

    // -------------------------------------------------------------------------
    // SlotMap - owning arena addressed by generational handles
    // -------------------------------------------------------------------------
    // Records live in a dense vector of slots. Freed slots are queued on a FIFO
    // free list and reused by later allocations with a bumped generation, so a
    // stale handle fails lookup with DanglingHandle rather than aliasing the new
    // occupant. A slot whose generation would wrap is retired for good.
    //
    // Single-threaded by design: callers own exclusive access while mutating.
    // -------------------------------------------------------------------------
    template <typename T, GenerationalHandle Handle>
    class SlotMap
    {
    public:
        SlotMap() = default;

        SlotMap(const SlotMap&) = default;
        SlotMap& operator=(const SlotMap&) = default;
        SlotMap(SlotMap&&) noexcept = default;
        SlotMap& operator=(SlotMap&&) noexcept = default;

        [[nodiscard]] Handle Allocate(T value)
        {
            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                assert(m_Slots.size() < std::numeric_limits<uint32_t>::max());
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            slot.Data = std::move(value);
            ++slot.Generation;
            slot.IsActive = true;
            ++m_LiveCount;

            return Handle{index, slot.Generation};
        }

        // Convenience overload for creating in-place
        template<typename... Args>
        [[nodiscard]] Handle Emplace(Args&&... args)
        {
            return Allocate(T{std::forward<Args>(args)...});
        }

        Result Free(Handle handle)
        {
            if (!Contains(handle)) return Err(ErrorCode::DanglingHandle);

            Slot& slot = m_Slots[handle.Index];
            slot.IsActive = false;
            slot.Data = T{};
            --m_LiveCount;

            // Recycling a slot at max generation would hand out generation 0 again.
            if (slot.Generation != std::numeric_limits<uint32_t>::max())
                m_FreeIndices.push_back(handle.Index);

            return Ok();
        }

        [[nodiscard]] bool Contains(Handle handle) const noexcept
        {
            if (handle.Index >= m_Slots.size()) return false;
            const Slot& slot = m_Slots[handle.Index];
            return slot.IsActive && slot.Generation == handle.Generation;
        }

        [[nodiscard]] Expected<T*> Get(Handle handle)
        {
            if (!Contains(handle))
                return std::unexpected(ErrorCode::DanglingHandle);
            return &m_Slots[handle.Index].Data;
        }

        [[nodiscard]] Expected<const T*> Get(Handle handle) const
        {
            if (!Contains(handle))
                return std::unexpected(ErrorCode::DanglingHandle);
            return &m_Slots[handle.Index].Data;
        }

        // Hot-path access.
        // WARNING: Only use if you are sure the handle is live.
        [[nodiscard]] T& operator[](Handle handle)
        {
            assert(Contains(handle));
            return m_Slots[handle.Index].Data;
        }

        [[nodiscard]] const T& operator[](Handle handle) const
        {
            assert(Contains(handle));
            return m_Slots[handle.Index].Data;
        }

        // Handle of the live record at a raw slot index, or an invalid handle.
        [[nodiscard]] Handle HandleAt(std::size_t index) const noexcept
        {
            if (index >= m_Slots.size() || !m_Slots[index].IsActive) return Handle{};
            return Handle{static_cast<uint32_t>(index), m_Slots[index].Generation};
        }

        [[nodiscard]] std::size_t Size() const noexcept { return m_LiveCount; }
        [[nodiscard]] std::size_t Capacity() const noexcept { return m_Slots.size(); }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_LiveCount == 0; }

        void Reserve(std::size_t n) { m_Slots.reserve(n); }

        // Drops every record but keeps generation counters, so handles taken
        // before the clear stay stale after their slots are reused.
        void Clear()
        {
            m_FreeIndices.clear();
            for (std::size_t i = 0; i < m_Slots.size(); ++i)
            {
                Slot& slot = m_Slots[i];
                slot.Data = T{};
                slot.IsActive = false;
                if (slot.Generation != std::numeric_limits<uint32_t>::max())
                    m_FreeIndices.push_back(static_cast<uint32_t>(i));
            }
            m_LiveCount = 0;
        }

        // ---------------------------------------------------------------------
        // Live handle iteration
        // ---------------------------------------------------------------------
        class HandleIterator
        {
        public:
            using value_type = Handle;
            using difference_type = std::ptrdiff_t;
            using iterator_category = std::forward_iterator_tag;

            HandleIterator() = default;
            HandleIterator(const SlotMap* map, std::size_t index) : m_Map(map), m_Index(index) { SkipInactive(); }

            [[nodiscard]] Handle operator*() const { return m_Map->HandleAt(m_Index); }

            HandleIterator& operator++()
            {
                ++m_Index;
                SkipInactive();
                return *this;
            }

            HandleIterator operator++(int)
            {
                HandleIterator tmp = *this;
                ++*this;
                return tmp;
            }

            bool operator==(const HandleIterator& other) const { return m_Index == other.m_Index; }

        private:
            void SkipInactive()
            {
                while (m_Index < m_Map->m_Slots.size() && !m_Map->m_Slots[m_Index].IsActive) ++m_Index;
            }

            const SlotMap* m_Map = nullptr;
            std::size_t m_Index = 0;
        };

        class HandleRange
        {
        public:
            explicit HandleRange(const SlotMap* map) : m_Map(map) {}
            [[nodiscard]] HandleIterator begin() const { return HandleIterator(m_Map, 0); }
            [[nodiscard]] HandleIterator end() const { return HandleIterator(m_Map, m_Map->m_Slots.size()); }

        private:
            const SlotMap* m_Map;
        };

        // Iterating while allocating or freeing in the same map is not supported.
        [[nodiscard]] HandleRange Handles() const { return HandleRange(this); }

    private:
        struct Slot
        {
            T Data{};
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::size_t m_LiveCount = 0;
    };
}
