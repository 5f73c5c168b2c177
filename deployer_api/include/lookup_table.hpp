#pragma once

#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <tuple>
#include <utility>

namespace util {
    /**
     * Fixed 1:1 table between two value types (e.g. names to enums), searchable either way.
     */
    template<typename VT1, typename VT2, uint32_t Nm>
    class LookupTable {
    public:
        using source_type = VT1;
        using mapped_type = VT2;

    private:
        std::array<VT1, Nm> _first;
        std::array<VT2, Nm> _second;

        template<size_t... Is, typename Tuple>
        constexpr LookupTable(std::index_sequence<Is...>, Tuple args) noexcept
            : _first{std::get<Is * 2>(args)...}, _second{std::get<Is * 2 + 1>(args)...} {
        }

        template<typename Arr, typename V>
        static constexpr std::optional<uint32_t> search(const Arr &arr, const V &v) noexcept {
            for(uint32_t i = 0; i < Nm; ++i) {
                if(arr[i] == v) {
                    return i;
                }
            }
            return {};
        }

    public:
        template<typename... Ts>
        constexpr explicit LookupTable(const Ts &...args) noexcept
            : LookupTable{std::make_index_sequence<sizeof...(Ts) / 2>{}, std::tie(args...)} {
            static_assert(sizeof...(Ts) % 2 == 0, "LookupTable must consist of kv-pairs");
            static_assert(sizeof...(Ts) / 2 == Nm, "Size mismatch");
        }

        [[nodiscard]] constexpr uint32_t size() const noexcept {
            return Nm;
        }

        template<typename K>
        [[nodiscard]] constexpr std::optional<VT2> lookup(const K &v) const noexcept {
            if(auto i = search(_first, v); i.has_value()) {
                return _second[i.value()];
            }
            return {};
        }

        template<typename K>
        [[nodiscard]] constexpr std::optional<VT1> rlookup(const K &v) const noexcept {
            if(auto i = search(_second, v); i.has_value()) {
                return _first[i.value()];
            }
            return {};
        }

        template<typename K>
        [[nodiscard]] constexpr VT2 lookupOr(const K &v, const VT2 &dflt) const noexcept {
            return lookup(v).value_or(dflt);
        }
    };
    template<typename VT1, typename VT2, typename... Rest>
    LookupTable(const VT1 &v1, const VT2 &v2, const Rest &...args)
        -> LookupTable<VT1, VT2, 1 + sizeof...(Rest) / 2>;

} // namespace util
