#pragma once
#include "termgate/gateway.h"
#include <catch2/catch.hpp>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <oxenc/bt_serialize.h>

extern "C" {
#include <poll.h>
}

using namespace termgate;

// Apple's mutexes, thread scheduling, and IO handling are garbage and it shows up with lots of
// spurious failures in this test suite (because it expects a system to not suck that badly), so we
// multiply the time-sensitive bits by this factor as a hack to make the test suite work.
constexpr int TIME_DILATION =
#ifdef __APPLE__
    5;
#else
    1;
#endif

static auto startup = std::chrono::steady_clock::now();

// Catch2 macros aren't thread safe, so guard with a mutex
inline std::unique_lock<std::mutex> catch_lock() {
    static std::mutex mutex;
    return std::unique_lock<std::mutex>{mutex};
}

/// Waits up to 500ms for something to happen.
template <typename Func>
inline void wait_for(Func f) {
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 50; i++) {
        if (f())
            break;
        std::this_thread::sleep_for(10ms * TIME_DILATION);
    }
    auto lock = catch_lock();
    UNSCOPED_INFO("done waiting after " << (std::chrono::steady_clock::now() - start).count() << "ns");
}

inline Gateway::Logger get_logger(std::string prefix = "") {
    std::string me = "tests/common.h";
    std::string strip = __FILE__;
    if (strip.substr(strip.size() - me.size()) == me)
        strip.resize(strip.size() - me.size());
    else
        strip.clear();

    return [prefix,strip](LogLevel lvl, std::string file, int line, std::string msg) {
        if (!strip.empty() && file.substr(0, strip.size()) == strip)
            file = file.substr(strip.size());

        auto lock = catch_lock();
        UNSCOPED_INFO(prefix << "[" << file << ":" << line << "/"
                "+" << std::chrono::duration<double>(std::chrono::steady_clock::now() - startup).count() << "s]: "
                << lvl << ": " << msg);
    };
}

/// Returns the function name of a call or cast frame.
inline std::string action_function(std::string_view frame) {
    auto term = decode_term(frame);
    if (auto* c = std::get_if<Call>(&term)) return c->function;
    if (auto* c = std::get_if<Cast>(&term)) return c->function;
    throw std::invalid_argument{"not an action term"};
}

/// PoolManager with a fixed number of assets per pool that keeps track of every lease and return.
class TestPool : public PoolManager {
public:
    explicit TestPool(std::map<std::string, int> sizes) {
        uint64_t token = 1;
        for (auto& [pool, n] : sizes)
            for (int i = 0; i < n; i++)
                idle[pool].push_back(Asset{pool + "/" + std::to_string(i), token++});
    }

    std::optional<Asset> lease(const std::string& pool) override {
        std::lock_guard lock{mutex};
        auto it = idle.find(pool);
        if (it == idle.end())
            throw std::out_of_range{"no such pool " + pool};
        if (it->second.empty())
            return std::nullopt;
        Asset a = it->second.back();
        it->second.pop_back();
        out.emplace(a.token, pool);
        leases++;
        return a;
    }

    void release(const std::string& pool, Asset asset) override {
        std::lock_guard lock{mutex};
        auto it = out.find(asset.token);
        if (it == out.end() || it->second != pool)
            bad_releases++;
        else
            out.erase(it);
        idle[pool].push_back(std::move(asset));
        releases++;
    }

    int idle_count() override {
        std::lock_guard lock{mutex};
        int n = 0;
        for (auto& [pool, assets] : idle)
            n += static_cast<int>(assets.size());
        return n;
    }

    void reload() override {
        if (fail_reload)
            throw std::runtime_error{"reload exploded"};
        reloads++;
    }

    std::atomic<int> leases{0}, releases{0}, bad_releases{0}, reloads{0};
    std::atomic<bool> fail_reload{false};

private:
    std::mutex mutex;
    std::map<std::string, std::vector<Asset>> idle;
    std::map<uint64_t, std::string> out;
};

/// WorkerTransport that records every call and replies with `["reply", Function]`.  Calls to a
/// function that has been `hold()`en block until it is `release()`d; calls to "explode" throw.
class TestTransport : public WorkerTransport {
public:
    std::string rpc(const Asset&, std::string_view request) override {
        auto fn = action_function(request);
        std::unique_lock lock{mutex};
        calls.push_back(fn);
        cv.wait_for(lock, 5s * TIME_DILATION, [&] { return !held.count(fn); });
        finished.push_back(fn);
        if (fn == "explode")
            throw std::runtime_error{"worker exploded"};
        return encode_reply(fn);
    }

    void hold(const std::string& fn) {
        std::lock_guard lock{mutex};
        held.insert(fn);
    }

    void release(const std::string& fn) {
        {
            std::lock_guard lock{mutex};
            held.erase(fn);
        }
        cv.notify_all();
    }

    void release_all() {
        {
            std::lock_guard lock{mutex};
            held.clear();
        }
        cv.notify_all();
    }

    std::vector<std::string> get_calls() {
        std::lock_guard lock{mutex};
        return calls;
    }

    std::vector<std::string> get_finished() {
        std::lock_guard lock{mutex};
        return finished;
    }

private:
    std::mutex mutex;
    std::condition_variable cv;
    std::set<std::string> held;
    std::vector<std::string> calls, finished;
};

/// Applies the settings every test gateway wants: localhost on an ephemeral port, fast polling.
inline void test_settings(Gateway& gw) {
    gw.BIND_ADDRESS = "127.0.0.1";
    gw.POLL_INTERVAL = 10ms;
    gw.listen(0);
}

/// Connects to the gateway and sends one term.
inline Connection send_term(uint16_t port, const Term& term) {
    auto c = connect_tcp("127.0.0.1", port);
    if (!c.send_frame(encode_term(term)))
        throw std::runtime_error{"failed to send request"};
    return c;
}

/// Waits (up to 2s) for a frame or for the connection to close; returns std::nullopt on close
/// (including a reset).
inline std::optional<std::string> read_response(Connection& c) {
    pollfd p{c.fd(), POLLIN, 0};
    if (::poll(&p, 1, 2000 * TIME_DILATION) <= 0)
        throw std::runtime_error{"timed out waiting for a response"};
    std::atomic<bool> never{false};
    try {
        return c.read_frame(1 << 20, never, 10ms);
    } catch (const std::system_error&) {
        return std::nullopt;
    }
}

/// Extracts the payload of a `["reply", Payload]` term.
inline std::string reply_payload(std::string_view frame) {
    oxenc::bt_list_consumer c{frame};
    if (c.consume_string_view() != "reply")
        throw std::invalid_argument{"not a reply term"};
    return c.consume_string();
}

/// Sends an admin command and returns the reply payload.
inline std::string admin(uint16_t port, std::string fn) {
    auto c = send_term(port, AdminCall{std::move(fn), ""});
    auto resp = read_response(c);
    if (!resp)
        throw std::runtime_error{"admin connection closed without a reply"};
    return reply_payload(*resp);
}
