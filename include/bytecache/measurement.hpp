#include <type_traits>

#include "detail/traits.h"

namespace bytecache::measurement {

namespace detail {

template<typename V> const auto& pointee(const V& object)
{
    if constexpr (bytecache::detail::traits::has_dereference<V>) {
        return *object;
    } else {
        return object;
    }
}

}  // namespace detail

template<typename T> template<typename V> uint64_t Size<T>::operator()(const V& object) const
{
    const auto& value = detail::pointee(object);
    using Value       = std::decay_t<decltype(value)>;

    if constexpr (bytecache::detail::traits::stl::has_data<Value>) {
        return static_cast<uint64_t>(value.size()) * sizeof(*value.data());
    } else {
        return static_cast<uint64_t>(value.size());
    }
}

template<typename T> template<typename V> uint64_t SizeOf<T>::operator()(const V& /* object */) const
{
    return sizeof(T);
}

}  // namespace bytecache::measurement
