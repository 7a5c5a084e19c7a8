#pragma once

#include <libusb.h>
#include <spdlog/spdlog.h>

#include "usb_tree/asio.hpp"
#include "usb_tree/libusb.hpp"

namespace usb_tree
{
    // Holds the libusb context used for enumeration on behalf of one
    // execution context. The libusb context is opened on first use, so a
    // host without USB access reports an error code from context() rather
    // than throwing out of asio::use_service().
    class usb_service final : public asio::execution_context::service
    {
      public:
        using key_type = usb_service;

        explicit usb_service(asio::execution_context& context)
          : asio::execution_context::service{context}
        {
        }

        usb_service(usb_service const&) = delete;

        usb_service(usb_service&&) = delete;

        void shutdown() noexcept override
        {
            context_.reset();
        }

        [[nodiscard]] auto context(error_code& ec) -> ::libusb_context*
        {
            ec.clear();
            if (context_) { return context_.get(); }

            auto handle = static_cast<::libusb_context*>(nullptr);
            if (!libusb_succeeded(::libusb_init(&handle), ec))
            {
                spdlog::debug("opening libusb failed: {}", ec.message());
                return nullptr;
            }

            spdlog::trace("opened libusb context");
            context_.reset(handle);
            return handle;
        }

        auto operator=(usb_service const&) -> usb_service& = delete;

        auto operator=(usb_service&&) -> usb_service& = delete;

      private:
        libusb_context_ptr context_;
    };
}  // namespace usb_tree
