/// @file
/// Example of resolving a generic netlink family (and its multicast groups) with libnlwire,
/// using a Linux `AF_NETLINK` socket.
///
/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT
///

#include "platform/linux/netlink_socket.hpp"

#include <libnlwire/errors.hpp>
#include <libnlwire/genl/controller.hpp>
#include <libnlwire/session/errors.hpp>
#include <libnlwire/session/session.hpp>
#include <libnlwire/time_provider.hpp>
#include <libnlwire/types.hpp>
#include <libnlwire/wire/message_codec.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

namespace
{

using namespace example::platform::Linux;  // NOLINT This our main concern here in this test.
using namespace libnlwire;                 // NOLINT This our main concern here in this test.
using namespace libnlwire::genl;           // NOLINT This our main concern here in this test.

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class Example_01_GenlResolveFamily : public testing::Test
{
protected:
    void SetUp() override
    {
        // Log levels (`SPDLOG_LEVEL` variable), like "debug" or "nlwire=debug". Default is "info".
        spdlog::cfg::load_env_levels();
        logger_ = spdlog::get("nlwire");
        if (!logger_)
        {
            logger_ = spdlog::stdout_color_mt("nlwire");
        }

        // Family to resolve. Default is the controller itself ("nlctrl").
        if (const auto* const family_str = std::getenv("NLWIRE__FAMILY"))
        {
            family_name_ = family_str;
        }
        // Multicast group of the family to resolve. Default is "notify" (of the "nlctrl").
        if (const auto* const group_str = std::getenv("NLWIRE__GROUP"))
        {
            group_name_ = group_str;
        }

        auto socket_result = NetlinkSocket::make(*cetl::pmr::get_default_resource(), time_provider_);
        if (const auto* const failure = cetl::get_if<IoError>(&socket_result))
        {
            socket_open_error_ = failure->code;
            return;
        }
        socket_ = std::move(cetl::get<std::unique_ptr<NetlinkSocket>>(socket_result));
    }

    // MARK: Data members:

    // NOLINTBEGIN
    SystemTimeProvider               time_provider_;
    std::unique_ptr<NetlinkSocket>   socket_;
    int                              socket_open_error_{0};
    std::string                      family_name_{"nlctrl"};
    std::string                      group_name_{"notify"};
    std::shared_ptr<spdlog::logger>  logger_;
    const wire::GenericMessageSchema schema_{Controller::attributeSchema()};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(Example_01_GenlResolveFamily, resolve)
{
    if (!socket_)
    {
        GTEST_SKIP() << "Netlink socket is not available (errno=" << socket_open_error_ << ").";
    }

    session::Session session{*cetl::pmr::get_default_resource(), time_provider_, *socket_, schema_, logger_};
    Controller       controller{session};

    const auto info_result = controller.resolveFamilyInfo(family_name_, time_provider_.now() + 1s);
    ASSERT_THAT(info_result, VariantWith<FamilyInfo>(testing::_));
    const auto& info = cetl::get<FamilyInfo>(info_result);

    logger_->info("Family '{}' (id={}, version={}, max_attr={}).",
                  family_name_,
                  info.id,
                  info.version,
                  info.max_attribute);
    for (const auto& operation : info.operations)
    {
        logger_->info("  operation (cmd={}, flags={:#x})", operation.id, operation.flags);
    }
    for (const auto& group : info.multicast_groups)
    {
        logger_->info("  multicast group '{}' (id={})", std::string{group.name.data(), group.name.size()}, group.id);
    }
    if (family_name_ == "nlctrl")
    {
        EXPECT_THAT(info.id, Ctrl::FamilyId);
    }

    const auto group_result = controller.resolveMulticastGroup(family_name_, group_name_, time_provider_.now() + 1s);
    if (const auto* const group_id = cetl::get_if<std::uint32_t>(&group_result))
    {
        logger_->info("Joining multicast group '{}' (id={}).", group_name_, *group_id);
        EXPECT_THAT(socket_->addMembership(*group_id), testing::Eq(cetl::nullopt));
    }

    // Unknown family is reported by the kernel as `ENOENT`.
    EXPECT_THAT(controller.resolveFamily("nlwire_nofam", time_provider_.now() + 1s),
                VariantWith<Controller::Failure>(VariantWith<session::KernelError>(
                    testing::Field(&session::KernelError::code, -ENOENT))));

    // Nothing is expected to be announced in such short time, but whatever arrives is just queued.
    EXPECT_THAT(session.poll(time_provider_.now() + std::chrono::milliseconds{10}), testing::Eq(cetl::nullopt));
    while (const auto event = session.takeUnsolicited())
    {
        logger_->info("Notification (type={}, seq={}).", event->message.header.type, event->message.header.sequence);
    }
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
