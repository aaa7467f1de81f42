//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file myssh.hpp
/// Generic header, not much here

#include "myssh/asio.hpp"
#include "myssh/error.hpp"
#include "myssh/packet.hpp"
#include "myssh/session.hpp"
#include "myssh/stream.hpp"
#include "myssh/types.hpp"
#include "myssh/x11_auth.hpp"
#include "myssh/x11_channel.hpp"
#include "myssh/x11_display.hpp"
#include "myssh/x11_forwarding.hpp"
#include "myssh/xauthority.hpp"
