//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file types.hpp
/// Common types in this library

#include <cstdint>
#include <string>
#include <vector>

namespace myssh
{

// blob should be made a bit more secure one day

/// \brief Class containing a number of unsigned bytes
using blob = std::vector<uint8_t>;

/// \brief The one X11 authentication protocol we support
const std::string kX11AuthProtocol("MIT-MAGIC-COOKIE-1");

/// \brief The size of the pseudo cookie handed to the server
const std::size_t kX11CookieSize = 16;

} // namespace myssh
