// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryDefs.hpp"
#include <atomic>
#include <cstddef>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <set>

class SonosDatagramSocket;

//! One received datagram, or the failure to receive one
struct SonosReply
{
    SonosReply(void):
        ret(-1)
    {
        return;
    }

    int ret; //!< bytes received or negative error
    std::string addr; //!< sender url (address and port)
    std::string payload; //!< datagram contents
    std::string error; //!< socket error message when ret < 0
};

/*!
 * Collect search replies from a socket until a deadline or a device count.
 *
 * Each receive runs on a worker thread that delivers its result through
 * a future. The collector waits on that future for at most one attempt
 * timeout before it rechecks the deadline and the device count.
 * A worker that outlives its attempt stays pending and is awaited again
 * by the next attempt, so at most one worker exists per collector.
 */
class SONOS_DISCOVERY_API SonosReplyCollector
{
public:

    /*!
     * Create a collector for replies on the given socket.
     * \param sock the socket shared with the session and the worker
     * \param signature replies count when the payload contains this
     * \param attemptTimeoutUs maximum wait on a single receive
     * \param mtu receive buffer size in bytes
     */
    SonosReplyCollector(
        const std::shared_ptr<SonosDatagramSocket> &sock,
        const std::string &signature = SONOS_REPLY_SIGNATURE,
        const long attemptTimeoutUs = SONOS_DISCOVERY_ATTEMPT_TIMEOUT_US,
        const size_t mtu = SONOS_DISCOVERY_RECV_MTU);

    //! Cancels and joins a pending worker
    virtual ~SonosReplyCollector(void);

    /*!
     * Receive replies while now < deadline and fewer than maxDevices were found.
     * Receive errors and unrelated replies are skipped.
     * \return the set of distinct sender addresses with matching replies
     */
    std::set<std::string> collect(const std::chrono::steady_clock::time_point &deadline, const size_t maxDevices);

    /*!
     * Filter and deduplicate a single reply.
     * Empty payloads and senders already in found are ignored.
     * \return true when the sender address was added to found
     */
    bool handleReply(const SonosReply &reply, std::set<std::string> &found) const;

    /*!
     * Cancel the pending receive worker and wait for it to exit.
     * Safe to call when no worker is running.
     */
    void shutdown(void);

    //! Is a receive worker outstanding?
    bool pending(void) const
    {
        return _worker != nullptr;
    }

protected:
    /*!
     * Start a thread running receiveLoop().
     * Throws std::system_error when no thread can be created.
     */
    virtual std::thread *spawnWorker(std::promise<SonosReply> promise);

private:
    std::shared_ptr<SonosDatagramSocket> _sock;
    const std::string _signature;
    const long _attemptTimeoutUs;
    const size_t _mtu;

    //the outstanding receive worker
    std::thread *_worker;
    std::future<SonosReply> _reply;

    //signal done to the worker
    std::atomic<bool> _done;

    bool launchWorker(void);
    void reapWorker(void);
    void receiveLoop(std::shared_ptr<SonosDatagramSocket> sock, std::promise<SonosReply> promise);
};
