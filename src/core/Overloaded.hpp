// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace toolbridge
{

/// @brief Combines lambdas into one visitor for std::visit.
template <typename... Ts>
struct Overloaded: Ts...
{
    using Ts::operator()...;
};

} // namespace toolbridge
