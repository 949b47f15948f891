#ifndef SHADE_FUNCTION_REF_HPP
#define SHADE_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace shade {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace shade

#endif
