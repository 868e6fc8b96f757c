#include "gateway.h"
#include "gateway-internal.h"
#include <optional>
#include <oxenc/bt_serialize.h>

namespace termgate {

namespace {

// Runs the end-of-task triple exactly once, whichever way the task exits: the asset goes back to
// its pool, the proxy is told a slot is free, and the connection is closed.
struct task_cleanup {
    Gateway& gw;
    PoolManager& pools;
    uint64_t id;
    Request& request;
    Asset& asset;
    std::optional<zmq::socket_t>& control;

    ~task_cleanup() {
        try {
            pools.release(request.pool, std::move(asset));
        } catch (const std::exception& e) {
            gw.log(LogLevel::error, __FILE__, __LINE__, "Task ", id, " failed to return its asset to pool ", request.pool, ": ", e.what());
        }
        try {
            if (control)
                detail::send_control(*control, "FREED", oxenc::bt_serialize(id));
            else
                gw.log(LogLevel::error, __FILE__, __LINE__, "Task ", id, " has no control socket; unable to signal FREED");
        } catch (const std::exception& e) {
            gw.log(LogLevel::error, __FILE__, __LINE__, "Task ", id, " failed to signal FREED: ", e.what());
        }
        request.conn.close();
    }
};

} // anonymous namespace

void Gateway::task_thread(uint64_t id, Request request, Asset asset) {
    set_thread_name("tg-task" + std::to_string(id));

    std::optional<zmq::socket_t> control;
    task_cleanup cleanup{*this, *pools, id, request, asset, control};

    try {
        control.emplace(connect_control());

        auto term = decode_term(request.action);
        if (auto* call = std::get_if<Call>(&term)) {
            TG_LOG(debug, "Task ", id, " calling ", call->module, ":", call->function, " on ", asset);
            auto response = transport->rpc(asset, request.action);
            if (!request.conn.send_frame(response))
                TG_LOG(debug, "Unable to send ", call->module, ":", call->function, " response to ", request.conn.remote(),
                        "; remote has probably disconnected");
            request.conn.close();
        } else if (auto* cast = std::get_if<Cast>(&term)) {
            TG_LOG(debug, "Task ", id, " casting ", cast->module, ":", cast->function, " on ", asset);
            transport->rpc(asset, request.action);
        } else {
            TG_LOG(warn, "Task ", id, " was given a non-action term; ignoring request");
        }
    }
    catch (const oxenc::bt_deserialize_invalid& e) {
        TG_LOG(warn, "Task ", id, " deserialization failed: ", e.what(), "; ignoring request");
    }
    catch (const std::exception& e) {
        TG_LOG(warn, "Task ", id, " caught exception when processing request: ", e.what());
    }
    catch (...) {
        TG_LOG(warn, "Task ", id, " caught non-standard exception when processing request");
    }
}

}
