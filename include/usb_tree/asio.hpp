#pragma once

#ifdef USB_TREE_USE_STANDALONE_ASIO

#include <system_error>

#include <asio/execution_context.hpp>
#include <asio/io_context.hpp>

#else

#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#endif

namespace usb_tree
{
#ifdef USB_TREE_USE_STANDALONE_ASIO
    namespace asio = ::asio;

    using error_code = std::error_code;
    using error_category = std::error_category;
    using error_condition = std::error_condition;
    using system_error = std::system_error;
#else
    namespace asio = boost::asio;

    using error_code = boost::system::error_code;
    using error_category = boost::system::error_category;
    using error_condition = boost::system::error_condition;
    using system_error = boost::system::system_error;
#endif
}  // namespace usb_tree
