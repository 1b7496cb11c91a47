/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_SESSION_SESSION_HPP_INCLUDED
#define LIBNLWIRE_SESSION_SESSION_HPP_INCLUDED

#include "errors.hpp"
#include "reassembler.hpp"
#include "request_handle.hpp"
#include "sequence_generator.hpp"
#include "types.hpp"

#include "libnlwire/config.hpp"
#include "libnlwire/errors.hpp"
#include "libnlwire/time_provider.hpp"
#include "libnlwire/transport/socket.hpp"
#include "libnlwire/types.hpp"
#include "libnlwire/wire/defines.hpp"
#include "libnlwire/wire/message.hpp"
#include "libnlwire/wire/message_codec.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pmr/function.hpp>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <tuple>
#include <utility>

namespace libnlwire
{
namespace session
{

/// @brief Defines the session correlator of a single netlink socket.
///
/// The session assigns sequence numbers to outbound requests, keeps the registry of pending requests
/// (keyed by sequence number and the local port id), and routes every inbound message either
/// to the multipart reassembler of its pending request, or (if there is no such request) to the unsolicited
/// messages channel - a callback (if set), or otherwise a bounded queue (see `takeUnsolicited`).
///
/// The registry is protected by a mutex, so requests could be sent and awaited from different threads.
/// Socket reads are serialized - only one thread (the reader) reads at a time, and every read is fully routed
/// before the next one is issued. Other awaiters wait for their outcome (or their deadline) without reading,
/// so a reader with a distant deadline never holds back an awaiter with a closer one.
/// There is no process wide state - several sessions (over different sockets) could coexist.
///
/// No Sonar cpp:S4963 "The "Rule-of-Zero" should be followed"
/// b/c we do directly handle resources here.
///
class Session final : private detail::IRequestRegistry  // NOSONAR cpp:S4963
{
public:
    /// @brief Defines unsolicited message callback (arguments, function).
    ///
    struct OnUnsolicitedCallback
    {
        struct Arg
        {
            Unsolicited& event;
            TimePoint    approx_now;
        };
        using Function =
            cetl::pmr::function<void(const Arg&), config::Session::OnUnsolicitedCallback_FunctionMaxSize()>;
    };

    /// @brief Defines result of a complete request/response exchange.
    ///
    using AwaitResult = Expected<ExchangeResult, AwaitFailure>;

    /// @brief Constructs a new session.
    ///
    /// @param memory Memory resource for the registry, and for the decoded messages.
    /// @param time_provider Source of the current time (for response deadlines).
    /// @param socket The netlink socket to communicate through. Must outlive the session.
    /// @param schema Schema of the inbound messages. Must outlive the session.
    /// @param logger Logger of the session (the default spdlog logger if not specified).
    ///
    Session(cetl::pmr::memory_resource&     memory,
            const ITimeProvider&            time_provider,
            transport::ISocket&             socket,
            const wire::IMessageSchema&     schema,
            std::shared_ptr<spdlog::logger> logger = spdlog::default_logger())
        : memory_{memory}
        , time_provider_{time_provider}
        , socket_{socket}
        , schema_{schema}
        , logger_{std::move(logger)}
        , pending_{PendingMap::allocator_type{&memory}}
        , unsolicited_{UnsolicitedQueue::allocator_type{&memory}}
    {
        CETL_DEBUG_ASSERT(logger_ != nullptr, "");
    }

    ~Session()
    {
        CETL_DEBUG_ASSERT(pending_.empty(), "Request handles must not outlive their session.");
    }

    Session(const Session&)                = delete;
    Session(Session&&) noexcept            = delete;
    Session& operator=(const Session&)     = delete;
    Session& operator=(Session&&) noexcept = delete;

    CETL_NODISCARD cetl::pmr::memory_resource& memory() const noexcept
    {
        return memory_;
    }

    wire::PortId getLocalPortId() const noexcept
    {
        return socket_.getLocalPortId();
    }

    /// @brief Gets number of registered requests (awaiting their responses, or not fetched yet).
    ///
    std::size_t getPendingCount() const
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};
        return pending_.size();
    }

    /// @brief Sends a request message.
    ///
    /// The next sequence number is assigned to the message (overriding the original one),
    /// and the `Flags::Request` flag is set. The pending request is registered before the message is sent,
    /// and it is deregistered again if sending fails.
    ///
    /// @param request The request message.
    /// @param deadline Deadline of the whole exchange. If not specified,
    ///                 `config::Session::DefaultResponseTimeout` from now is used.
    /// @return The request handle, or a failure (of encoding or sending).
    ///
    CETL_NODISCARD Expected<RequestHandle, SendFailure> sendRequest(wire::Message                   request,
                                                                    const cetl::optional<TimePoint> deadline = {})
    {
        const TimePoint response_deadline =
            deadline ? *deadline : (time_provider_.now() + config::Session::DefaultResponseTimeout());

        const ExchangeKey key = registerRequest(request.header.hasFlags(wire::Flags::Ack), response_deadline);

        request.header.sequence = key.sequence;
        request.header.flags    = static_cast<std::uint16_t>(request.header.flags | wire::Flags::Request);

        auto encode_result = wire::encode(request, memory_);
        if (auto* const failure = cetl::get_if<wire::EncodeFailure>(&encode_result))
        {
            (void) releaseRequest(key);
            logger_->warn("Failed to encode request (seq={}, type={}).", key.sequence, request.header.type);
            return libnlwire::detail::upcastVariant<SendFailure>(std::move(*failure));
        }
        const auto& bytes = cetl::get<Bytes>(encode_result);

        if (auto failure = socket_.send(libnlwire::detail::asSpan(bytes)))
        {
            (void) releaseRequest(key);
            logger_->warn("Failed to send request (seq={}, code={}).", key.sequence, failure->code);
            return *failure;
        }

        logger_->debug("Request sent (seq={}, type={}, flags={:#x}, size={}).",
                       key.sequence,
                       request.header.type,
                       request.header.flags,
                       bytes.size());

        return RequestHandle{*this, key, response_deadline};
    }

    /// @brief Awaits the terminal outcome of a request.
    ///
    /// Blocks (by reading the socket, and routing whatever arrives) until the exchange is complete,
    /// or its deadline is reached. While another thread reads the socket, just waits for that thread
    /// to route the outcome (but not beyond the deadline). Once the outcome is fetched, the request is deregistered.
    ///
    /// @return The exchange result, or a failure. `CancelledError` is returned if the request
    ///         is not registered anymore (cancelled, or its outcome has been fetched already);
    ///         `ArgumentError` is returned for a handle issued by another session (or a moved-from one).
    ///
    CETL_NODISCARD AwaitResult awaitResponse(RequestHandle& handle)
    {
        if (handle.getRegistry() != this)
        {
            return ArgumentError{};
        }
        if (handle.isCancelled())
        {
            return CancelledError{};
        }

        const ExchangeKey key      = handle.getKey();
        const TimePoint   deadline = handle.getDeadline();
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock{registry_mutex_};
                if (auto outcome = fetchOutcome(key))
                {
                    return std::move(*outcome);
                }
                if (is_reading_)
                {
                    // Another thread reads the socket - it will route our response (if any) as well.
                    waitForOutcomeOrReader(lock, deadline);
                    continue;
                }
                is_reading_ = true;
            }

            UnsolicitedList unsolicited{UnsolicitedList::allocator_type{&memory_}};
            (void) receiveAndRoute(deadline, unsolicited);
            releaseReader();

            // Any transport failure has already been recorded as the outcome of all pending requests.
            deliverUnsolicited(unsolicited);
        }
    }

    /// @brief Sends a request and awaits its outcome.
    ///
    CETL_NODISCARD Expected<ExchangeResult, AnyFailure> request(wire::Message                   request,
                                                                const cetl::optional<TimePoint> deadline = {})
    {
        auto send_result = sendRequest(std::move(request), deadline);
        if (auto* const failure = cetl::get_if<SendFailure>(&send_result))
        {
            return libnlwire::detail::upcastVariant<AnyFailure>(std::move(*failure));
        }
        auto& handle = cetl::get<RequestHandle>(send_result);

        auto await_result = awaitResponse(handle);
        if (auto* const failure = cetl::get_if<AwaitFailure>(&await_result))
        {
            return libnlwire::detail::upcastVariant<AnyFailure>(std::move(*failure));
        }
        return cetl::get<ExchangeResult>(std::move(await_result));
    }

    /// @brief Reads (at most one datagram from) the socket, and routes its messages.
    ///
    /// In use by applications which just listen (f.e. to multicast notifications), without awaiting any response.
    /// If another thread reads the socket at the moment, waits for it (up to the deadline) first.
    ///
    /// @return `nullopt` if a datagram was routed, or nothing has arrived before the deadline.
    ///         Otherwise, the transport failure (which has failed all pending requests as well).
    ///
    CETL_NODISCARD cetl::optional<IoError> poll(const TimePoint deadline)
    {
        {
            std::unique_lock<std::mutex> lock{registry_mutex_};
            while (is_reading_)
            {
                if (time_provider_.now() >= deadline)
                {
                    return cetl::nullopt;
                }
                waitForOutcomeOrReader(lock, deadline);
            }
            is_reading_ = true;
        }

        UnsolicitedList unsolicited{UnsolicitedList::allocator_type{&memory_}};
        auto            failure = receiveAndRoute(deadline, unsolicited);
        releaseReader();

        deliverUnsolicited(unsolicited);
        return failure;
    }

    /// @brief Sets callback which is called for every unsolicited message.
    ///
    /// The callback is called outside of the registry and socket locks, but it still must not block for long -
    /// other exchanges are not advanced while it runs. If not set (the default), unsolicited messages
    /// are kept in a bounded queue (the oldest one is dropped once the queue is full).
    /// Messages which were already queued stay in the queue.
    ///
    void setOnUnsolicitedCallback(OnUnsolicitedCallback::Function&& function)
    {
        const std::lock_guard<std::mutex> lock{callback_mutex_};
        on_unsolicited_cb_fn_ = std::move(function);
    }

    /// @brief Takes the oldest queued unsolicited message (if any).
    ///
    CETL_NODISCARD cetl::optional<Unsolicited> takeUnsolicited()
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};
        if (unsolicited_.empty())
        {
            return cetl::nullopt;
        }
        Unsolicited event = std::move(unsolicited_.front());
        unsolicited_.pop_front();
        return event;
    }

    std::size_t getUnsolicitedCount() const
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};
        return unsolicited_.size();
    }

    /// @brief Sets next sequence number.
    ///
    /// In use for testing purposes.
    ///
    void setNextSequenceNumber(const wire::SequenceNumber sequence)
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};
        sequence_generator_.setNextSequenceNumber(sequence);
    }

private:
    struct PendingRequest final
    {
        PendingRequest(cetl::pmr::memory_resource& memory, const bool expects_ack, const TimePoint deadline)
            : deadline{deadline}
            , reassembler{memory, expects_ack}
        {
        }

        TimePoint                   deadline;
        Reassembler                 reassembler;
        cetl::optional<AwaitResult> outcome;

    };  // PendingRequest

    using PendingMap = std::map<ExchangeKey,
                                PendingRequest,
                                std::less<ExchangeKey>,
                                cetl::pmr::polymorphic_allocator<std::pair<const ExchangeKey, PendingRequest>>>;

    using UnsolicitedQueue = std::deque<Unsolicited, cetl::pmr::polymorphic_allocator<Unsolicited>>;
    using UnsolicitedList  = PmrVector<Unsolicited>;

    ExchangeKey registerRequest(const bool expects_ack, const TimePoint deadline)
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};

        ExchangeKey key{sequence_generator_.nextSequenceNumber(), socket_.getLocalPortId()};
        while (pending_.find(key) != pending_.end())
        {
            // Skip sequence numbers of (very old) requests which are still registered.
            key.sequence = sequence_generator_.nextSequenceNumber();
        }

        (void) pending_.emplace(std::piecewise_construct,
                                std::forward_as_tuple(key),
                                std::forward_as_tuple(memory_, expects_ack, deadline));
        return key;
    }

    /// Fetches the outcome of a request (and deregisters it) if the request has terminated.
    ///
    /// Should be called with the `registry_mutex_` locked.
    ///
    cetl::optional<AwaitResult> fetchOutcome(const ExchangeKey& key)
    {
        const auto it = pending_.find(key);
        if (it == pending_.end())
        {
            return AwaitResult{CancelledError{}};
        }

        if (it->second.outcome)
        {
            AwaitResult outcome = std::move(*it->second.outcome);
            pending_.erase(it);
            return outcome;
        }

        const TimePoint deadline = it->second.deadline;
        if (time_provider_.now() >= deadline)
        {
            pending_.erase(it);
            logger_->debug("Request expired (seq={}).", key.sequence);
            return AwaitResult{ResponseExpiredError{deadline}};
        }

        return cetl::nullopt;
    }

    /// Waits (with the `registry_mutex_` locked by the `lock`) until either some outcome is recorded,
    /// the current reader is done, or the deadline is reached.
    ///
    /// The wait is measured by the time provider, so it is bounded by the deadline
    /// even if the reader is blocked in the socket for much longer.
    ///
    void waitForOutcomeOrReader(std::unique_lock<std::mutex>& lock, const TimePoint deadline)
    {
        const TimePoint now = time_provider_.now();
        if (now < deadline)
        {
            (void) state_changed_.wait_for(lock, deadline - now);
        }
    }

    void releaseReader()
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};
        is_reading_ = false;
        state_changed_.notify_all();
    }

    /// Should be called by the reader only (see `is_reading_`).
    ///
    cetl::optional<IoError> receiveAndRoute(const TimePoint deadline, UnsolicitedList& unsolicited)
    {
        auto receive_result = socket_.receive(deadline);
        if (const auto* const failure = cetl::get_if<IoError>(&receive_result))
        {
            failAllPending(*failure);
            return *failure;
        }

        const auto& datagram = cetl::get<transport::ISocket::ReceiveResult::Success>(receive_result);
        if (datagram)
        {
            routeDatagram(libnlwire::detail::asSpan(*datagram), unsolicited);
        }
        return cetl::nullopt;
    }

    void routeDatagram(const ConstBytesSpan bytes, UnsolicitedList& unsolicited)
    {
        const wire::PortId local_port_id = socket_.getLocalPortId();

        (void) wire::decodeEach(bytes, schema_, memory_, [this, local_port_id, &unsolicited](auto&& result) {
            //
            if (auto* const failure = cetl::get_if<wire::MessageDecodeFailure>(&result))
            {
                routeFailure(*failure, local_port_id);
                return;
            }
            routeMessage(cetl::get<wire::Message>(std::move(result)), local_port_id, unsolicited);
        });
    }

    void routeMessage(wire::Message&& message, const wire::PortId local_port_id, UnsolicitedList& unsolicited)
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};

        auto* const pending = findPending(message.header, local_port_id);
        if (pending == nullptr)
        {
            logger_->debug("Unsolicited message (type={}, seq={}, port={}).",
                           message.header.type,
                           message.header.sequence,
                           message.header.port_id);
            unsolicited.push_back(Unsolicited{std::move(message)});
            return;
        }

        const wire::SequenceNumber sequence = message.header.sequence;
        if (auto outcome = pending->reassembler.accept(std::move(message)))
        {
            if (auto* const failure = cetl::get_if<ExchangeFailure>(&*outcome))
            {
                logger_->debug("Exchange failed (seq={}, error={}).", sequence, failure->index());
                pending->outcome.emplace(libnlwire::detail::upcastVariant<AwaitFailure>(std::move(*failure)));
            }
            else
            {
                logger_->debug("Exchange completed (seq={}).", sequence);
                pending->outcome.emplace(cetl::get<ExchangeResult>(std::move(*outcome)));
            }
            state_changed_.notify_all();
        }
    }

    void routeFailure(wire::MessageDecodeFailure& failure, const wire::PortId local_port_id)
    {
        if (!failure.header)
        {
            logger_->warn("Malformed datagram, the rest of it is dropped (error={}).", failure.cause.index());
            return;
        }

        const std::lock_guard<std::mutex> lock{registry_mutex_};

        logger_->warn("Malformed message rejected (type={}, seq={}, error={}).",
                      failure.header->type,
                      failure.header->sequence,
                      failure.cause.index());

        // The exchange can't be completed properly anymore, so it fails with the decoding error.
        if (auto* const pending = findPending(*failure.header, local_port_id))
        {
            pending->outcome.emplace(libnlwire::detail::upcastVariant<AwaitFailure>(std::move(failure.cause)));
            state_changed_.notify_all();
        }
    }

    /// Should be called with the `registry_mutex_` locked.
    ///
    PendingRequest* findPending(const wire::Header& header, const wire::PortId local_port_id)
    {
        // Kernel replies are addressed to the requester's port, but zero port is matched as the local one too.
        const wire::PortId port_id = (header.port_id == 0) ? local_port_id : header.port_id;

        const auto it = pending_.find(ExchangeKey{header.sequence, port_id});
        if ((it == pending_.end()) || it->second.outcome.has_value())
        {
            return nullptr;
        }
        return &it->second;
    }

    void failAllPending(const IoError& failure)
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};

        std::size_t failed_count = 0;
        for (auto& entry : pending_)
        {
            if (!entry.second.outcome)
            {
                entry.second.outcome.emplace(AwaitResult{failure});
                ++failed_count;
            }
        }
        logger_->warn("Socket receive failed (code={}), {} pending request(s) failed.", failure.code, failed_count);
        state_changed_.notify_all();
    }

    void deliverUnsolicited(UnsolicitedList& unsolicited)
    {
        if (unsolicited.empty())
        {
            return;
        }

        {
            // The registry is not locked here, so the callback could call back the session
            // (except for changing the callback itself).
            const std::lock_guard<std::mutex> cb_lock{callback_mutex_};
            if (on_unsolicited_cb_fn_)
            {
                const TimePoint approx_now = time_provider_.now();
                for (auto& event : unsolicited)
                {
                    on_unsolicited_cb_fn_(OnUnsolicitedCallback::Arg{event, approx_now});
                }
                return;
            }
        }

        const std::lock_guard<std::mutex> lock{registry_mutex_};
        for (auto& event : unsolicited)
        {
            if (unsolicited_.size() >= config::Session::UnsolicitedQueueCapacity())
            {
                const auto& oldest = unsolicited_.front().message.header;
                logger_->warn("Unsolicited queue is full, the oldest message (type={}, seq={}) is dropped.",
                              oldest.type,
                              oldest.sequence);
                unsolicited_.pop_front();
            }
            unsolicited_.push_back(std::move(event));
        }
    }

    // MARK: IRequestRegistry

    bool releaseRequest(const ExchangeKey& key) noexcept override
    {
        const std::lock_guard<std::mutex> lock{registry_mutex_};
        return pending_.erase(key) > 0;
    }

    // MARK: Data members:

    cetl::pmr::memory_resource&     memory_;
    const ITimeProvider&            time_provider_;
    transport::ISocket&             socket_;
    const wire::IMessageSchema&     schema_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex              registry_mutex_;
    std::condition_variable         state_changed_;
    bool                            is_reading_{false};
    std::mutex                      callback_mutex_;
    detail::SequenceNumberGenerator sequence_generator_;
    PendingMap                      pending_;
    UnsolicitedQueue                unsolicited_;
    OnUnsolicitedCallback::Function on_unsolicited_cb_fn_;

};  // Session

}  // namespace session
}  // namespace libnlwire

#endif  // LIBNLWIRE_SESSION_SESSION_HPP_INCLUDED
