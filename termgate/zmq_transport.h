#pragma once
#include <chrono>
#include <zmq.hpp>
#include "pool.h"

namespace termgate {

/**
 * WorkerTransport that talks to workers over ZeroMQ.  Each asset's endpoint is a zmq address (for
 * example `tcp://127.0.0.1:5000` or `ipc:///run/worker-3.sock`) on which the worker has bound a
 * REP (or ROUTER) socket.  Each call connects a REQ socket, sends the action frame as a single
 * message part and waits for the single-part response.
 */
class ZmqTransport : public WorkerTransport {
public:
    /// `timeout` bounds how long rpc() waits for a worker's response.
    explicit ZmqTransport(std::chrono::milliseconds timeout = std::chrono::seconds{30});

    std::string rpc(const Asset& asset, std::string_view request) override;

private:
    zmq::context_t context;
    std::chrono::milliseconds timeout;
};

}
