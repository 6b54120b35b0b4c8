#pragma once

/*
===============================================================================
aob - Event Queue Core, Public API Entry Point
===============================================================================

The event-recording and order-identifier core of a limit order book:

  - aob::EventQueue   circular Fill / Out log inside a borrowed account,
                      order id generator and single-slot register
  - aob::Layout       account sizing for a given callback_info_len / capacity
  - aob::snapshot     checksummed account images for offline inspection

The price index, matching and market setup are owned by the caller.
===============================================================================
*/

#include <aob/types.hpp>
#include <aob/constants.hpp>
#include <aob/status.hpp>
#include <aob/account.hpp>
#include <aob/order_id.hpp>
#include <aob/order_summary.hpp>
#include <aob/register.hpp>
#include <aob/layout.hpp>
#include <aob/event/event.hpp>
#include <aob/event/codec.hpp>
#include <aob/event_queue/header.hpp>
#include <aob/event_queue.hpp>
#include <aob/snapshot/file.hpp>
