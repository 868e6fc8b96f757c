#include "common.h"

TEST_CASE("casts are acknowledged before they run", "[cast]") {
    auto pool = std::make_shared<TestPool>(std::map<std::string, int>{{"P", 1}});
    auto transport = std::make_shared<TestTransport>();
    Gateway gw{pool, transport, get_logger("G» "), LogLevel::trace};
    test_settings(gw);
    gw.add_pool({"P", {"m"}});
    gw.start();

    transport->hold("c");
    auto c = send_term(gw.port(), Cast{"m", "c", "l3:fooe"});
    auto ack = read_response(c);
    auto ack_end = read_response(c);
    wait_for([&] { return transport->get_calls().size() == 1; });
    {
        auto lock = catch_lock();
        REQUIRE( ack == encode_noreply() );
        REQUIRE_FALSE( ack_end );
        REQUIRE( transport->get_calls() == std::vector<std::string>{{"c"}} );
        REQUIRE( transport->get_finished().empty() );
    }

    transport->release("c");
    wait_for([&] { return pool->releases == 1; });
    auto s = gw.stats();
    {
        auto lock = catch_lock();
        REQUIRE( transport->get_finished() == std::vector<std::string>{{"c"}} );
        REQUIRE( s.total_dispatched == 1 );
        REQUIRE( s.idle_workers == 1 );
        REQUIRE( pool->bad_releases == 0 );
    }
}

TEST_CASE("casts queue like calls", "[cast]") {
    auto pool = std::make_shared<TestPool>(std::map<std::string, int>{{"P", 1}});
    auto transport = std::make_shared<TestTransport>();
    Gateway gw{pool, transport, get_logger("G» "), LogLevel::debug};
    test_settings(gw);
    gw.add_pool({"P", {"m"}});
    gw.start();

    transport->hold("a");
    auto a = send_term(gw.port(), Call{"m", "a", ""});
    wait_for([&] { return transport->get_calls().size() == 1; });

    auto c = send_term(gw.port(), Cast{"m", "c", ""});
    auto ack = read_response(c);
    wait_for([&] { return gw.stats().pending == 1; });
    auto s = gw.stats();
    {
        auto lock = catch_lock();
        REQUIRE( ack == encode_noreply() );
        REQUIRE( s.pending == 1 );
    }

    transport->release("a");
    auto ra = read_response(a);
    wait_for([&] { return transport->get_finished().size() == 2; });
    s = gw.stats();
    {
        auto lock = catch_lock();
        REQUIRE( ra );
        REQUIRE( transport->get_finished() == std::vector<std::string>{{"a", "c"}} );
        REQUIRE( s.total_dispatched == 2 );
        REQUIRE( s.pending == 0 );
    }
}
