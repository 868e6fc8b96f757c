#include "common.h"
#include "termgate/local_pool.h"
#include "termgate/zmq_transport.h"

namespace {

// A worker on a REP socket that answers each action with `["reply", Function]`, or not at all if
// `silent` is set.  (A silent worker only ever takes one request.)
struct test_worker {
    zmq::context_t ctx;
    zmq::socket_t rep{ctx, zmq::socket_type::rep};
    std::string endpoint;
    std::atomic<bool> done{false};
    std::atomic<int> handled{0};
    std::thread thread;

    explicit test_worker(bool silent = false) {
        rep.set(zmq::sockopt::linger, 0);
        rep.set(zmq::sockopt::rcvtimeo, 20);
        rep.bind("tcp://127.0.0.1:*");
        endpoint = rep.get(zmq::sockopt::last_endpoint);
        thread = std::thread{[this, silent] {
            while (!done) {
                zmq::message_t msg;
                if (!rep.recv(msg))
                    continue;
                handled++;
                if (silent) {
                    while (!done)
                        std::this_thread::sleep_for(5ms);
                    break;
                }
                std::string fn;
                try { fn = action_function(msg.to_string_view()); }
                catch (const std::exception&) { fn = "?"; }
                auto reply = encode_reply(fn);
                rep.send(zmq::message_t{reply.data(), reply.size()}, zmq::send_flags::none);
            }
        }};
    }

    ~test_worker() {
        done = true;
        thread.join();
    }
};

} // anonymous namespace

TEST_CASE("zmq transport round trip", "[zmq_transport]") {
    test_worker worker;
    ZmqTransport transport{2s};
    Asset asset{worker.endpoint, 1};

    auto resp = transport.rpc(asset, encode_term(Call{"m", "hello", ""}));
    REQUIRE( reply_payload(resp) == "hello" );
    resp = transport.rpc(asset, encode_term(Cast{"m", "again", ""}));
    REQUIRE( reply_payload(resp) == "again" );
    REQUIRE( worker.handled == 2 );
}

TEST_CASE("zmq transport timeout", "[zmq_transport]") {
    test_worker worker{true};
    ZmqTransport transport{50ms};
    auto started = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS( transport.rpc(Asset{worker.endpoint, 1}, encode_term(Call{"m", "f", ""})), std::runtime_error );
    REQUIRE( std::chrono::steady_clock::now() - started >= 50ms );

    REQUIRE_THROWS_AS( ZmqTransport{0ms}, std::out_of_range );
}

TEST_CASE("gateway with local pools and zmq workers", "[zmq_transport][admission]") {
    test_worker w1, w2;
    auto pools = std::make_shared<LocalPoolManager>(std::vector<PoolAssets>{
        {"P", {w1.endpoint}},
        {"Q", {w2.endpoint}},
    });
    Gateway gw{pools, std::make_shared<ZmqTransport>(2s), get_logger("G» "), LogLevel::trace};
    test_settings(gw);
    gw.add_pool({"P", {"p"}});
    gw.add_pool({"Q", {"q"}});
    gw.start();

    std::vector<Connection> clients;
    for (int i = 0; i < 5; i++) {
        clients.push_back(send_term(gw.port(), Call{"p", "p" + std::to_string(i), ""}));
        clients.push_back(send_term(gw.port(), Call{"q", "q" + std::to_string(i), ""}));
    }
    std::vector<std::string> replies;
    for (auto& c : clients) {
        auto r = read_response(c);
        replies.push_back(r ? reply_payload(*r) : "(closed)");
    }
    wait_for([&] { return pools->idle_count() == 2; });
    auto s = gw.stats();
    auto stats = admin(gw.port(), "stats");

    auto lock = catch_lock();
    for (int i = 0; i < 5; i++) {
        REQUIRE( replies[2*i] == "p" + std::to_string(i) );
        REQUIRE( replies[2*i+1] == "q" + std::to_string(i) );
    }
    REQUIRE( w1.handled == 5 );
    REQUIRE( w2.handled == 5 );
    REQUIRE( s.total_dispatched == 10 );
    REQUIRE( s.pending == 0 );
    REQUIRE( s.idle_workers == 2 );
    REQUIRE( stats == "connections.total=10\nworkers.idle=2\nconnections.pending=0\n" );
}
