#ifndef BYTECACHE_TRAITS_H
#define BYTECACHE_TRAITS_H

#include <cstddef>
#include <utility>

#include <boost/hana.hpp>

namespace bytecache::detail::traits {

// Traits for the containers receiving items out of the cache.
namespace stl {

template<typename T>
constexpr auto has_reserve =
    boost::hana::is_valid([](auto& t) -> decltype(boost::hana::traits::declval(t).reserve(std::declval<size_t>())) {})(boost::hana::type_c<T>);

template<typename T> constexpr auto has_size = boost::hana::is_valid([](auto& t) -> decltype(boost::hana::traits::declval(t).size()) {})(boost::hana::type_c<T>);

template<typename T, typename... Args>
constexpr auto has_emplace_back =
    boost::hana::is_valid([](auto& t) -> decltype(boost::hana::traits::declval(t).emplace_back(std::declval<Args>()...)) {})(boost::hana::type_c<T>);

template<typename T> constexpr auto has_data = boost::hana::is_valid([](auto& t) -> decltype(boost::hana::traits::declval(t).data()) {})(boost::hana::type_c<T>);

}  // namespace stl

// Raw pointers, smart pointers and anything else exposing a unary `operator*`.
template<typename T> constexpr auto has_dereference = boost::hana::is_valid([](auto& t) -> decltype(*boost::hana::traits::declval(t)) {})(boost::hana::type_c<T>);

/// @brief Reserve room for `count` more elements if the container knows its size and supports `reserve()`.
template<typename Container> void reserve_more(Container& container, size_t count)
{
    boost::hana::if_(
        boost::hana::and_(stl::has_reserve<Container>, stl::has_size<Container>),
        [count](auto& c) { c.reserve(c.size() + count); },
        [](auto&) {})(container);
}

/// @brief Add a pair to either a sequence container (`emplace_back`) or an associative container (`emplace`).
template<typename Container, typename First, typename Second> void emplace_pair(Container& container, const First& first, const Second& second)
{
    boost::hana::if_(
        stl::has_emplace_back<Container, First, Second>,
        [&](auto& seq_container) { seq_container.emplace_back(first, second); },
        [&](auto& assoc_container) { assoc_container.emplace(first, second); })(container);
}

}  // namespace bytecache::detail::traits

#endif
