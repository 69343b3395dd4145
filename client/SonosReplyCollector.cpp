// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include <SoapySDR/Logger.hpp>
#include "SonosReplyCollector.hpp"
#include "SonosDatagramSocket.hpp"
#include "SonosHTTPUtils.hpp"
#include "SonosURLUtils.hpp"
#include <algorithm>
#include <system_error>
#include <vector>

SonosReplyCollector::SonosReplyCollector(
    const std::shared_ptr<SonosDatagramSocket> &sock,
    const std::string &signature,
    const long attemptTimeoutUs,
    const size_t mtu):
    _sock(sock),
    _signature(signature),
    _attemptTimeoutUs(attemptTimeoutUs),
    _mtu(mtu),
    _worker(nullptr),
    _done(false)
{
    return;
}

SonosReplyCollector::~SonosReplyCollector(void)
{
    this->shutdown();
}

std::set<std::string> SonosReplyCollector::collect(const std::chrono::steady_clock::time_point &deadline, const size_t maxDevices)
{
    std::set<std::string> found;

    while (std::chrono::steady_clock::now() < deadline and found.size() < maxDevices)
    {
        //one receive in flight at a time, reuse a worker left from a timed out attempt
        if (_worker == nullptr and not this->launchWorker())
        {
            //no receive this attempt, sit it out and try again
            const std::chrono::steady_clock::time_point retry = std::chrono::steady_clock::now() + std::chrono::microseconds(_attemptTimeoutUs);
            std::this_thread::sleep_until(std::min(deadline, retry));
            continue;
        }

        //bounded wait on the worker, then recheck the deadline
        const auto status = _reply.wait_for(std::chrono::microseconds(_attemptTimeoutUs));
        if (status != std::future_status::ready) continue;

        const auto reply = _reply.get();
        this->reapWorker();

        if (reply.ret < 0)
        {
            SoapySDR::logf(SOAPY_SDR_DEBUG, "SonosReplyCollector::recvfrom() = %d\n  %s", reply.ret, reply.error.c_str());
            continue;
        }

        this->handleReply(reply, found);
    }

    return found;
}

bool SonosReplyCollector::handleReply(const SonosReply &reply, std::set<std::string> &found) const
{
    //the sender address identifies the device
    const auto node = SonosURL(reply.addr).getNode();

    //noise and repeated replies from a known device
    if (reply.payload.empty() or found.count(node) != 0) return false;

    if (reply.payload.find(_signature) == std::string::npos)
    {
        SoapySDR::logf(SOAPY_SDR_TRACE, "SonosSSDP ignored reply from %s", reply.addr.c_str());
        return false;
    }

    const SonosHTTPHeader header(reply.payload.data(), reply.payload.size());
    SoapySDR::logf(SOAPY_SDR_DEBUG, "SonosSSDP discovered %s [%s] %s",
        node.c_str(), header.getField("SERVER").c_str(), header.getField("LOCATION").c_str());

    found.insert(node);
    return true;
}

void SonosReplyCollector::shutdown(void)
{
    if (_worker == nullptr) return;
    _done = true;
    this->reapWorker();
}

bool SonosReplyCollector::launchWorker(void)
{
    std::promise<SonosReply> promise;
    auto reply = promise.get_future();
    _done = false;
    try
    {
        _worker = this->spawnWorker(std::move(promise));
    }
    catch (const std::system_error &ex)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SonosReplyCollector::launchWorker() FAIL: %s", ex.what());
        return false;
    }
    _reply = std::move(reply);
    return true;
}

std::thread *SonosReplyCollector::spawnWorker(std::promise<SonosReply> promise)
{
    return new std::thread(&SonosReplyCollector::receiveLoop, this, _sock, std::move(promise));
}

void SonosReplyCollector::reapWorker(void)
{
    _worker->join();
    delete _worker;
    _worker = nullptr;
}

void SonosReplyCollector::receiveLoop(std::shared_ptr<SonosDatagramSocket> sock, std::promise<SonosReply> promise)
{
    SonosReply reply;
    std::vector<char> buff(_mtu);

    //poll so that shutdown() can interrupt the wait
    while (true)
    {
        if (_done)
        {
            reply.error = "receive cancelled";
            break;
        }
        const int ready = sock->selectRecv(SONOS_DISCOVERY_SOCKET_TIMEOUT_US);
        if (ready == 0) continue;
        if (ready < 0)
        {
            //select fails without waiting, hold off for the poll period
            SoapySDR::logf(SOAPY_SDR_TRACE, "SonosReplyCollector::selectRecv() %s", sock->lastErrorMsg().c_str());
            std::this_thread::sleep_for(std::chrono::microseconds(SONOS_DISCOVERY_SOCKET_TIMEOUT_US));
            continue;
        }

        reply.ret = sock->recvfrom(buff.data(), buff.size(), reply.addr);
        if (reply.ret < 0) reply.error = sock->lastErrorMsg();
        else reply.payload.assign(buff.data(), size_t(reply.ret));
        break;
    }

    promise.set_value(reply);
}
