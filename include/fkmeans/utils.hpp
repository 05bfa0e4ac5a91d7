#ifndef FKMEANS_UTILS_HPP
#define FKMEANS_UTILS_HPP

#include <type_traits>

namespace fkmeans {

template<typename Input_>
using I = typename std::remove_cv<typename std::remove_reference<Input_>::type>::type;

}

#endif
