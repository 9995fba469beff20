// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef KERFENGINE_GENERIC_H
#define KERFENGINE_GENERIC_H

#include <type_traits>

namespace kerf::utils
{
template<typename Tp>
concept numeric = std::is_arithmetic_v<std::remove_cvref_t<Tp>>;
} // namespace kerf::utils

#endif // KERFENGINE_GENERIC_H
