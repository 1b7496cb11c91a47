/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#include "gtest_helpers.hpp"  // NOLINT(misc-include-cleaner)
#include "test_utilities.hpp"
#include "tracking_memory_resource.hpp"
#include "transport/socket_mock.hpp"
#include "virtual_time_provider.hpp"

#include <libnlwire/config.hpp>
#include <libnlwire/errors.hpp>
#include <libnlwire/session/errors.hpp>
#include <libnlwire/session/request_handle.hpp>
#include <libnlwire/session/session.hpp>
#include <libnlwire/session/types.hpp>
#include <libnlwire/time_provider.hpp>
#include <libnlwire/transport/socket.hpp>
#include <libnlwire/types.hpp>
#include <libnlwire/wire/attribute.hpp>
#include <libnlwire/wire/byte_cursor.hpp>
#include <libnlwire/wire/control_codec.hpp>
#include <libnlwire/wire/defines.hpp>
#include <libnlwire/wire/errors.hpp>
#include <libnlwire/wire/header_codec.hpp>
#include <libnlwire/wire/message.hpp>
#include <libnlwire/wire/message_codec.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace
{

using namespace libnlwire;           // NOLINT This our main concern here in the unit tests.
using namespace libnlwire::session;  // NOLINT This our main concern here in the unit tests.

using libnlwire::detail::asSpan;
using libnlwire::test_utilities::encodeBatch;
using libnlwire::test_utilities::makeIotaArray;

using wire::Flags;
using wire::Header;
using wire::Message;
using wire::GenericHeader;

using testing::_;
using testing::Eq;
using testing::AllOf;
using testing::Field;
using testing::Invoke;
using testing::Return;
using testing::SizeIs;
using testing::IsEmpty;
using testing::Optional;
using testing::HasSubstr;
using testing::FieldsAre;
using testing::StrictMock;
using testing::ElementsAre;
using testing::VariantWith;

using ReceiveResult = transport::ISocket::ReceiveResult;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

/// One-shot event between the threads of a test.
///
class Signal final
{
public:
    void set()
    {
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            is_set_ = true;
        }
        cv_.notify_all();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock{mutex_};
        cv_.wait(lock, [this] { return is_set_; });
    }

    bool waitFor(const Duration timeout)
    {
        std::unique_lock<std::mutex> lock{mutex_};
        return cv_.wait_for(lock, timeout, [this] { return is_set_; });
    }

private:
    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    is_set_{false};

};  // Signal

class TestSession : public testing::Test
{
protected:
    static constexpr wire::PortId      LocalPort  = 4242;
    static constexpr wire::MessageType FamilyType = 0x1C;

    void SetUp() override
    {
        cetl::pmr::set_default_resource(&mr_);

        logger_->set_level(spdlog::level::debug);

        EXPECT_CALL(socket_mock_, getLocalPortId()).WillRepeatedly(Return(LocalPort));
    }

    void TearDown() override
    {
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    std::unique_ptr<Session> makeSession()
    {
        return std::make_unique<Session>(mr_, time_provider_, socket_mock_, schema_, logger_);
    }

    Message makeRequest(const std::uint16_t flags, const std::uint8_t command = 1)
    {
        wire::AttributeList attributes{wire::AttributeList::allocator_type{&mr_}};
        attributes.push_back(wire::makeStringAttribute(mr_, 2, "eth0"));
        return wire::makeGenericMessage(Header{0, FamilyType, flags, 0, 0},
                                        GenericHeader{command, 1, 0},
                                        std::move(attributes));
    }

    Message makeReply(const wire::SequenceNumber sequence,
                      const std::uint16_t        flags,
                      const std::uint32_t        value,
                      const wire::PortId         port_id = LocalPort)
    {
        wire::AttributeList attributes{wire::AttributeList::allocator_type{&mr_}};
        attributes.push_back(wire::makeU32Attribute(mr_, 1, value));
        return wire::makeGenericMessage(Header{0, FamilyType, flags, sequence, port_id},
                                        GenericHeader{1, 1, 0},
                                        std::move(attributes));
    }

    /// Makes a header which the kernel would echo back in its ERROR/ACK messages.
    ///
    static Header echoed(const wire::SequenceNumber sequence, const std::uint16_t flags)
    {
        return Header{16 + 4 + 12, FamilyType, static_cast<std::uint16_t>(flags | Flags::Request), sequence, 0};
    }

    static ReceiveResult::Type datagramOf(const Bytes& bytes)
    {
        return ReceiveResult::Success{bytes};
    }

    static ReceiveResult::Type nothing()
    {
        return ReceiveResult::Success{};
    }

    /// Makes a receive action which "waits" until the given deadline, and reports that nothing has arrived.
    ///
    auto waitUntilDeadline()
    {
        return Invoke([this](const TimePoint deadline) {
            time_provider_.setNow(deadline);
            return nothing();
        });
    }

    std::string lastLogLine() const
    {
        const auto lines = log_sink_->last_formatted(1);
        return lines.empty() ? std::string{} : lines.front();
    }

    std::vector<std::string> logLines() const
    {
        return log_sink_->last_formatted();
    }

    // MARK: Data members:

    // NOLINTBEGIN
    TrackingMemoryResource                             mr_;
    VirtualTimeProvider                                time_provider_{TimePoint{} + std::chrono::hours{1}};
    StrictMock<transport::SocketMock>                  socket_mock_;
    const wire::GenericMessageSchema                   schema_{};
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> log_sink_{
        std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)};
    std::shared_ptr<spdlog::logger> logger_{std::make_shared<spdlog::logger>("session", log_sink_)};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestSession, request_single_reply)
{
    auto session = makeSession();
    EXPECT_THAT(session->getLocalPortId(), LocalPort);
    EXPECT_THAT(&session->memory(), Eq(&mr_));

    session->setNextSequenceNumber(100);

    const auto reply = makeReply(100, Flags::None, 0xDEADBEEF);
    const auto rx    = encodeBatch(mr_, {&reply});

    Bytes tx{Bytes::allocator_type{&mr_}};
    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Invoke([&tx](const ConstBytesSpan bytes) {
        tx.assign(bytes.begin(), bytes.end());
        return cetl::optional<IoError>{};
    }));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    const auto result = session->request(makeRequest(Flags::None));
    EXPECT_THAT(result, VariantWith<ExchangeResult>(VariantWith<Single>(Field(&Single::message, Eq(reply)))));
    EXPECT_THAT(session->getPendingCount(), 0U);
    EXPECT_THAT(session->getUnsolicitedCount(), 0U);

    // The request was stamped with the sequence number, and the REQUEST flag.
    const auto sent = wire::decode(asSpan(tx), schema_, mr_);
    ASSERT_THAT(sent, VariantWith<wire::MessageList>(SizeIs(1)));
    const auto& request = cetl::get<wire::MessageList>(sent).front();
    EXPECT_THAT(request.header, HeaderWith(FamilyType, Flags::Request, 100, 0));
    EXPECT_THAT(request.header.length, tx.size());
    EXPECT_THAT(request.generic, Optional(GenericHeader{1, 1, 0}));
}

TEST_F(TestSession, sequence_numbers_are_unique)
{
    auto session = makeSession();
    session->setNextSequenceNumber(std::numeric_limits<wire::SequenceNumber>::max());

    std::vector<wire::SequenceNumber> sequences;
    EXPECT_CALL(socket_mock_, send(_)).Times(3).WillRepeatedly(Invoke([&sequences](const ConstBytesSpan bytes) {
        wire::ReadCursor cursor{bytes};
        const auto       header = wire::decodeHeader(cursor);
        EXPECT_THAT(header, VariantWith<Header>(_));
        sequences.push_back(cetl::get<Header>(header).sequence);
        return cetl::optional<IoError>{};
    }));

    {
        auto handle1 = session->sendRequest(makeRequest(Flags::Ack));
        auto handle2 = session->sendRequest(makeRequest(Flags::Ack));
        auto handle3 = session->sendRequest(makeRequest(Flags::Ack));
        EXPECT_THAT(handle1, VariantWith<RequestHandle>(_));
        EXPECT_THAT(handle2, VariantWith<RequestHandle>(_));
        EXPECT_THAT(handle3, VariantWith<RequestHandle>(_));
        EXPECT_THAT(session->getPendingCount(), 3U);
    }
    // Dropped handles deregister their requests.
    EXPECT_THAT(session->getPendingCount(), 0U);

    EXPECT_THAT(sequences, ElementsAre(std::numeric_limits<wire::SequenceNumber>::max(), 1U, 2U));
}

TEST_F(TestSession, reply_is_held_until_ack)
{
    auto session = makeSession();
    session->setNextSequenceNumber(7);

    const auto reply = makeReply(7, Flags::None, 42);
    const auto ack   = wire::makeAckMessage(mr_, echoed(7, Flags::Ack));
    const auto rx1   = encodeBatch(mr_, {&reply});
    const auto rx2   = encodeBatch(mr_, {&ack});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_))
        .WillOnce(Invoke([&rx1](auto) { return datagramOf(rx1); }))
        .WillOnce(Invoke([&rx2](auto) { return datagramOf(rx2); }));

    const auto result = session->request(makeRequest(Flags::Ack));
    EXPECT_THAT(result, VariantWith<ExchangeResult>(VariantWith<Single>(Field(&Single::message, Eq(reply)))));
    EXPECT_THAT(session->getPendingCount(), 0U);
}

TEST_F(TestSession, ack_only_reply)
{
    auto session = makeSession();
    session->setNextSequenceNumber(8);

    const auto ack = wire::makeAckMessage(mr_, echoed(8, Flags::Ack));
    const auto rx  = encodeBatch(mr_, {&ack});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    const auto result = session->request(makeRequest(Flags::Ack));
    EXPECT_THAT(result,
                VariantWith<ExchangeResult>(VariantWith<Single>(
                    Field(&Single::message, Field(&Message::header, HeaderWith(wire::ControlType::Error,
                                                                               Flags::Capped,
                                                                               8,
                                                                               0))))));
}

TEST_F(TestSession, dump_across_datagrams)
{
    auto session = makeSession();
    session->setNextSequenceNumber(20);

    const auto part1 = makeReply(20, Flags::Multi, 1);
    const auto part2 = makeReply(20, Flags::Multi, 2);
    const auto part3 = makeReply(20, Flags::Multi, 3);
    const auto done  = wire::makeDoneMessage(mr_, 20, LocalPort);
    const auto rx1   = encodeBatch(mr_, {&part1, &part2});
    const auto rx2   = encodeBatch(mr_, {&part3, &done});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_))
        .WillOnce(Invoke([&rx1](auto) { return datagramOf(rx1); }))
        .WillOnce(Invoke([&rx2](auto) { return datagramOf(rx2); }));

    const auto result = session->request(makeRequest(Flags::Dump));
    EXPECT_THAT(result,
                VariantWith<ExchangeResult>(VariantWith<Multi>(
                    Field(&Multi::messages, ElementsAre(Eq(part1), Eq(part2), Eq(part3))))));
}

TEST_F(TestSession, kernel_error)
{
    auto session = makeSession();
    session->setNextSequenceNumber(30);

    const auto error = wire::makeErrorMessage(mr_, echoed(30, Flags::Ack), -ENOENT, "No such device");
    const auto rx    = encodeBatch(mr_, {&error});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    const auto result = session->request(makeRequest(Flags::Ack));
    ASSERT_THAT(result, VariantWith<AnyFailure>(KernelErrorWith(-ENOENT)));

    const auto& kernel_error = cetl::get<KernelError>(cetl::get<AnyFailure>(result));
    ASSERT_TRUE(kernel_error.message.has_value());
    EXPECT_THAT(*kernel_error.message, "No such device");
    EXPECT_THAT(kernel_error.request, Optional(echoed(30, Flags::Ack)));
    EXPECT_THAT(session->getPendingCount(), 0U);
}

TEST_F(TestSession, failed_dump_drops_collected)
{
    auto session = makeSession();
    session->setNextSequenceNumber(31);

    const auto part  = makeReply(31, Flags::Multi, 1);
    const auto error = wire::makeErrorMessage(mr_, echoed(31, Flags::Dump), -EBUSY);
    const auto rx    = encodeBatch(mr_, {&part, &error});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    const auto result = session->request(makeRequest(Flags::Dump));
    EXPECT_THAT(result,
                VariantWith<AnyFailure>(VariantWith<KernelError>(
                    AllOf(Field(&KernelError::code, -EBUSY), Field(&KernelError::discarded_count, 1U)))));
}

TEST_F(TestSession, unsolicited_messages_are_queued)
{
    auto session = makeSession();
    session->setNextSequenceNumber(40);

    // Multicast notifications (zero sequence number) are interleaved with the reply.
    const auto notification1 = makeReply(0, Flags::None, 1, 0);
    const auto notification2 = makeReply(0, Flags::None, 2, 0);
    const auto reply         = makeReply(40, Flags::None, 3);
    const auto rx            = encodeBatch(mr_, {&notification1, &reply, &notification2});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    const auto result = session->request(makeRequest(Flags::None));
    EXPECT_THAT(result, VariantWith<ExchangeResult>(VariantWith<Single>(Field(&Single::message, Eq(reply)))));

    EXPECT_THAT(session->getUnsolicitedCount(), 2U);
    EXPECT_THAT(session->takeUnsolicited(), Optional(Field(&Unsolicited::message, Eq(notification1))));
    EXPECT_THAT(session->takeUnsolicited(), Optional(Field(&Unsolicited::message, Eq(notification2))));
    EXPECT_THAT(session->takeUnsolicited(), Eq(cetl::nullopt));
}

TEST_F(TestSession, unsolicited_callback)
{
    auto session = makeSession();

    std::vector<std::uint32_t> values;
    std::vector<TimePoint>     times;
    session->setOnUnsolicitedCallback([&values, &times](const Session::OnUnsolicitedCallback::Arg& arg) {
        const auto* const attributes = arg.event.message.attributes();
        ASSERT_THAT(attributes, testing::NotNull());
        const auto value = wire::getU32(attributes->front());
        values.push_back(value.value_or(0));
        times.push_back(arg.approx_now);
    });

    const auto notification1 = makeReply(0, Flags::None, 11, 0);
    const auto notification2 = makeReply(0, Flags::None, 22, 0);
    const auto rx            = encodeBatch(mr_, {&notification1, &notification2});

    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    EXPECT_THAT(session->poll(time_provider_.now() + std::chrono::seconds{1}), Eq(cetl::nullopt));
    EXPECT_THAT(values, ElementsAre(11U, 22U));
    EXPECT_THAT(times, ElementsAre(time_provider_.now(), time_provider_.now()));
    EXPECT_THAT(session->getUnsolicitedCount(), 0U);

    session->setOnUnsolicitedCallback({});
}

TEST_F(TestSession, unsolicited_queue_drops_oldest)
{
    constexpr std::size_t Capacity = config::Session::UnsolicitedQueueCapacity();

    auto session = makeSession();

    // One datagram with more notifications than the queue can hold.
    Bytes rx{Bytes::allocator_type{&mr_}};
    {
        wire::WriteCursor cursor{rx, std::numeric_limits<std::size_t>::max()};
        for (std::uint32_t i = 0; i < Capacity + 2; ++i)
        {
            EXPECT_THAT(wire::encodeMessage(makeReply(0, Flags::None, i, 0), cursor), Eq(cetl::nullopt));
        }
    }
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    EXPECT_THAT(session->poll(time_provider_.now()), Eq(cetl::nullopt));
    EXPECT_THAT(session->getUnsolicitedCount(), Capacity);
    EXPECT_THAT(logLines(), testing::Contains(HasSubstr("Unsolicited queue is full")));

    const auto first = session->takeUnsolicited();
    ASSERT_TRUE(first.has_value());
    ASSERT_THAT(first->message.attributes(), testing::NotNull());
    EXPECT_THAT(wire::getU32(first->message.attributes()->front()), Optional(2U));
}

TEST_F(TestSession, zero_port_matches_local)
{
    auto session = makeSession();
    session->setNextSequenceNumber(50);

    const auto reply = makeReply(50, Flags::None, 5, 0);
    const auto rx    = encodeBatch(mr_, {&reply});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    const auto result = session->request(makeRequest(Flags::None));
    EXPECT_THAT(result, VariantWith<ExchangeResult>(VariantWith<Single>(_)));
}

TEST_F(TestSession, foreign_port_is_unsolicited)
{
    auto session = makeSession();
    session->setNextSequenceNumber(51);

    const auto foreign = makeReply(51, Flags::None, 5, LocalPort + 1);
    const auto rx      = encodeBatch(mr_, {&foreign});

    const auto deadline = time_provider_.now() + std::chrono::milliseconds{100};

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(deadline))
        .WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }))
        .WillOnce(waitUntilDeadline());

    const auto result = session->request(makeRequest(Flags::None), deadline);
    EXPECT_THAT(result, VariantWith<AnyFailure>(VariantWith<ResponseExpiredError>(FieldsAre(deadline))));
    EXPECT_THAT(session->getUnsolicitedCount(), 1U);
    EXPECT_THAT(session->getPendingCount(), 0U);
}

TEST_F(TestSession, response_expired_with_default_timeout)
{
    auto session = makeSession();

    const auto deadline = time_provider_.now() + config::Session::DefaultResponseTimeout();

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(deadline)).WillOnce(waitUntilDeadline());

    const auto result = session->request(makeRequest(Flags::Ack));
    EXPECT_THAT(result, VariantWith<AnyFailure>(VariantWith<ResponseExpiredError>(FieldsAre(deadline))));
    EXPECT_THAT(session->getPendingCount(), 0U);
}

TEST_F(TestSession, late_reply_is_unsolicited)
{
    auto session = makeSession();
    session->setNextSequenceNumber(60);

    const auto deadline = time_provider_.now() + std::chrono::seconds{1};

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(deadline)).WillOnce(waitUntilDeadline());
    EXPECT_THAT(session->request(makeRequest(Flags::None), deadline),
                VariantWith<AnyFailure>(VariantWith<ResponseExpiredError>(_)));

    const auto reply = makeReply(60, Flags::None, 5);
    const auto rx    = encodeBatch(mr_, {&reply});
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    EXPECT_THAT(session->poll(time_provider_.now()), Eq(cetl::nullopt));
    EXPECT_THAT(session->takeUnsolicited(), Optional(Field(&Unsolicited::message, Eq(reply))));
}

TEST_F(TestSession, io_error_fails_all_pending)
{
    auto session = makeSession();

    EXPECT_CALL(socket_mock_, send(_)).Times(2).WillRepeatedly(Return(cetl::nullopt));

    auto send_result1 = session->sendRequest(makeRequest(Flags::Ack));
    auto send_result2 = session->sendRequest(makeRequest(Flags::Ack));
    ASSERT_THAT(send_result1, VariantWith<RequestHandle>(_));
    ASSERT_THAT(send_result2, VariantWith<RequestHandle>(_));
    auto& handle1 = cetl::get<RequestHandle>(send_result1);
    auto& handle2 = cetl::get<RequestHandle>(send_result2);

    // Only one socket read - the second request already has its outcome.
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Return(IoError{-ENOBUFS}));

    EXPECT_THAT(session->awaitResponse(handle1), VariantWith<AwaitFailure>(VariantWith<IoError>(FieldsAre(-ENOBUFS))));
    EXPECT_THAT(session->awaitResponse(handle2), VariantWith<AwaitFailure>(VariantWith<IoError>(FieldsAre(-ENOBUFS))));
    EXPECT_THAT(session->getPendingCount(), 0U);
    EXPECT_THAT(lastLogLine(), HasSubstr("2 pending request(s) failed"));
}

TEST_F(TestSession, poll_reports_io_error)
{
    auto session = makeSession();

    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Return(IoError{-EBADF}));
    EXPECT_THAT(session->poll(time_provider_.now()), Optional(FieldsAre(-EBADF)));

    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Return(nothing()));
    EXPECT_THAT(session->poll(time_provider_.now()), Eq(cetl::nullopt));
}

TEST_F(TestSession, send_failure_releases_request)
{
    auto session = makeSession();

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(IoError{-EPERM}));

    const auto result = session->sendRequest(makeRequest(Flags::Ack));
    EXPECT_THAT(result, VariantWith<SendFailure>(VariantWith<IoError>(FieldsAre(-EPERM))));
    EXPECT_THAT(session->getPendingCount(), 0U);
}

TEST_F(TestSession, encode_failure_releases_request)
{
    auto session = makeSession();

    // Bigger than any encoded message could be - nothing is sent.
    Bytes huge{config::Wire::DefaultEncodeCapacity(), cetl::byte{0x55}, Bytes::allocator_type{&mr_}};
    auto  request = wire::makeRawMessage(mr_, Header{0, FamilyType, Flags::None, 0, 0}, asSpan(huge));

    const auto result = session->request(std::move(request));
    EXPECT_THAT(result, VariantWith<AnyFailure>(VariantWith<wire::BufferFullError>(_)));
    EXPECT_THAT(session->getPendingCount(), 0U);
}

TEST_F(TestSession, malformed_reply_fails_only_its_request)
{
    auto session = makeSession();
    session->setNextSequenceNumber(70);

    EXPECT_CALL(socket_mock_, send(_)).Times(2).WillRepeatedly(Return(cetl::nullopt));

    auto send_result1 = session->sendRequest(makeRequest(Flags::None));
    auto send_result2 = session->sendRequest(makeRequest(Flags::None));
    ASSERT_THAT(send_result1, VariantWith<RequestHandle>(_));
    ASSERT_THAT(send_result2, VariantWith<RequestHandle>(_));
    auto& handle1 = cetl::get<RequestHandle>(send_result1);
    auto& handle2 = cetl::get<RequestHandle>(send_result2);

    // Family message without (complete) generic header.
    const Header malformed_header{0, FamilyType, Flags::None, 70, LocalPort};
    const auto   malformed = wire::makeRawMessage(mr_, malformed_header, makeIotaArray<2>(0));
    const auto   reply     = makeReply(71, Flags::None, 71);
    const auto   rx        = encodeBatch(mr_, {&malformed, &reply});

    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    EXPECT_THAT(session->awaitResponse(handle1),
                VariantWith<AwaitFailure>(VariantWith<wire::MalformedError>(
                    FieldsAre(16, wire::MalformedError::Reason::PayloadTooSmall))));
    EXPECT_THAT(session->awaitResponse(handle2),
                VariantWith<ExchangeResult>(VariantWith<Single>(Field(&Single::message, Eq(reply)))));
}

TEST_F(TestSession, cancelled_request)
{
    auto session = makeSession();

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));

    auto send_result = session->sendRequest(makeRequest(Flags::Ack));
    ASSERT_THAT(send_result, VariantWith<RequestHandle>(_));
    auto& handle = cetl::get<RequestHandle>(send_result);
    EXPECT_THAT(session->getPendingCount(), 1U);

    handle.cancel();
    EXPECT_THAT(session->getPendingCount(), 0U);
    EXPECT_THAT(session->awaitResponse(handle), VariantWith<AwaitFailure>(VariantWith<CancelledError>(_)));
}

TEST_F(TestSession, outcome_is_fetched_once)
{
    auto session = makeSession();
    session->setNextSequenceNumber(80);

    const auto reply = makeReply(80, Flags::None, 8);
    const auto rx    = encodeBatch(mr_, {&reply});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&rx](auto) { return datagramOf(rx); }));

    auto send_result = session->sendRequest(makeRequest(Flags::None));
    ASSERT_THAT(send_result, VariantWith<RequestHandle>(_));
    auto& handle = cetl::get<RequestHandle>(send_result);

    EXPECT_THAT(session->awaitResponse(handle), VariantWith<ExchangeResult>(_));
    EXPECT_THAT(session->awaitResponse(handle), VariantWith<AwaitFailure>(VariantWith<CancelledError>(_)));
}

TEST_F(TestSession, handle_of_another_session)
{
    auto session1 = makeSession();
    auto session2 = makeSession();

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));

    auto send_result = session1->sendRequest(makeRequest(Flags::Ack));
    ASSERT_THAT(send_result, VariantWith<RequestHandle>(_));
    auto& handle = cetl::get<RequestHandle>(send_result);

    EXPECT_THAT(session2->awaitResponse(handle), VariantWith<AwaitFailure>(VariantWith<ArgumentError>(_)));
    EXPECT_THAT(session1->getPendingCount(), 1U);

    RequestHandle moved{std::move(handle)};
    // NOLINTNEXTLINE(bugprone-use-after-move,hicpp-invalid-access-moved)
    EXPECT_THAT(session1->awaitResponse(handle), VariantWith<AwaitFailure>(VariantWith<ArgumentError>(_)));

    moved.cancel();
}

TEST_F(TestSession, noop_does_not_complete_exchange)
{
    auto session = makeSession();
    session->setNextSequenceNumber(90);

    const auto noop  = wire::makeRawMessage(mr_, Header{0, wire::ControlType::Noop, Flags::None, 90, LocalPort}, {});
    const auto reply = makeReply(90, Flags::None, 9);
    const auto rx1   = encodeBatch(mr_, {&noop});
    const auto rx2   = encodeBatch(mr_, {&reply});

    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_))
        .WillOnce(Invoke([&rx1](auto) { return datagramOf(rx1); }))
        .WillOnce(Return(nothing()))
        .WillOnce(Invoke([&rx2](auto) { return datagramOf(rx2); }));

    const auto result = session->request(makeRequest(Flags::None));
    EXPECT_THAT(result, VariantWith<ExchangeResult>(VariantWith<Single>(Field(&Single::message, Eq(reply)))));
    EXPECT_THAT(session->getUnsolicitedCount(), 0U);
}

TEST_F(TestSession, awaiter_is_not_held_by_another_reader)
{
    const SystemTimeProvider system_time;
    Session                  session{mr_, system_time, socket_mock_, schema_, logger_};
    session.setNextSequenceNumber(10);

    const auto reply = makeReply(10, Flags::None, 7);
    const auto rx    = encodeBatch(mr_, {&reply});

    Signal is_reading;
    Signal is_replied;
    EXPECT_CALL(socket_mock_, send(_)).Times(2).WillRepeatedly(Return(cetl::nullopt));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&](const TimePoint deadline) {
        is_reading.set();
        // Blocks (as a real socket does) until the kernel replies, or until the deadline.
        return is_replied.waitFor(deadline - system_time.now()) ? datagramOf(rx) : nothing();
    }));

    auto slow_result = session.sendRequest(makeRequest(Flags::None), system_time.now() + std::chrono::seconds{2});
    ASSERT_THAT(slow_result, VariantWith<RequestHandle>(_));
    auto& slow_handle = cetl::get<RequestHandle>(slow_result);

    cetl::optional<Session::AwaitResult> slow_outcome;
    std::thread reader{[&session, &slow_handle, &slow_outcome] {
        slow_outcome = session.awaitResponse(slow_handle);
    }};
    is_reading.wait();

    // The reader is blocked in the socket for up to 2s, but this exchange expires on its own (closer) deadline.
    const auto started       = std::chrono::steady_clock::now();
    const auto fast_deadline = system_time.now() + std::chrono::milliseconds{100};
    const auto fast_result   = session.request(makeRequest(Flags::None), fast_deadline);
    const auto took          = std::chrono::steady_clock::now() - started;

    is_replied.set();
    reader.join();

    EXPECT_THAT(fast_result, VariantWith<AnyFailure>(VariantWith<ResponseExpiredError>(FieldsAre(fast_deadline))));
    EXPECT_THAT(std::chrono::duration_cast<std::chrono::milliseconds>(took).count(), testing::Lt(1000));

    ASSERT_TRUE(slow_outcome.has_value());
    EXPECT_THAT(*slow_outcome, VariantWith<ExchangeResult>(VariantWith<Single>(Field(&Single::message, Eq(reply)))));
    EXPECT_THAT(session.getPendingCount(), 0U);
}

TEST_F(TestSession, response_is_routed_by_polling_thread)
{
    const SystemTimeProvider system_time;
    Session                  session{mr_, system_time, socket_mock_, schema_, logger_};
    session.setNextSequenceNumber(20);

    const auto reply = makeReply(20, Flags::None, 8);
    const auto rx    = encodeBatch(mr_, {&reply});

    Signal is_reading;
    Signal is_sent;
    EXPECT_CALL(socket_mock_, send(_)).WillOnce(Invoke([&is_sent](auto) {
        is_sent.set();
        return cetl::optional<IoError>{};
    }));
    EXPECT_CALL(socket_mock_, receive(_)).WillOnce(Invoke([&](const TimePoint deadline) {
        is_reading.set();
        return is_sent.waitFor(deadline - system_time.now()) ? datagramOf(rx) : nothing();
    }));

    cetl::optional<IoError> poll_failure{IoError{-1}};
    std::thread             listener{[&session, &system_time, &poll_failure] {
        poll_failure = session.poll(system_time.now() + std::chrono::seconds{2});
    }};
    is_reading.wait();

    // The request is sent (and registered) while the listener reads; its response is routed by the listener.
    const auto result = session.request(makeRequest(Flags::None), system_time.now() + std::chrono::seconds{2});
    listener.join();

    EXPECT_THAT(result, VariantWith<ExchangeResult>(VariantWith<Single>(Field(&Single::message, Eq(reply)))));
    EXPECT_THAT(poll_failure, Eq(cetl::nullopt));
    EXPECT_THAT(session.getPendingCount(), 0U);
    EXPECT_THAT(session.getUnsolicitedCount(), 0U);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
