#include "protocol.h"
#include <stdexcept>
#include <type_traits>
#include <oxenc/bt_serialize.h>
#include <oxenc/variant.h>

namespace termgate {

using namespace std::literals;

namespace {

// Returns true if the consumer has reached the end of its list.  Unlike is_finished() this is safe
// to call on truncated input.
bool at_end(const oxenc::bt_list_consumer& c) {
    auto buf = c.current_buffer();
    if (buf.empty())
        throw oxenc::bt_deserialize_invalid{"truncated term"};
    return buf.front() == 'e';
}

// Consumes the next value of any type and returns its raw encoded bytes.
std::string consume_raw(oxenc::bt_list_consumer& c) {
    auto before = c.current_buffer();
    c.skip_value();
    return std::string{before.substr(0, before.size() - c.current_buffer().size())};
}

void expect_finished(oxenc::bt_list_consumer& c, std::string_view tag) {
    if (!at_end(c))
        throw oxenc::bt_deserialize_invalid{"unexpected trailing elements in `" + std::string{tag} + "' term"};
    if (c.current_buffer().size() != 1)
        throw oxenc::bt_deserialize_invalid{"unexpected data after `" + std::string{tag} + "' term"};
}

std::string encode_action(std::string_view tag, std::string_view mod, std::string_view fun, std::string_view args) {
    std::string out{"l"};
    out += oxenc::bt_serialize(tag);
    out += oxenc::bt_serialize(mod);
    out += oxenc::bt_serialize(fun);
    out += args.empty() ? "le"sv : args;
    out += 'e';
    return out;
}

} // anonymous namespace

Term decode_term(std::string_view data) {
    if (data.empty() || data.front() != 'l')
        throw oxenc::bt_deserialize_invalid{"term is not a list"};
    oxenc::bt_list_consumer c{data};
    if (at_end(c))
        throw oxenc::bt_deserialize_invalid{"empty term"};
    auto tag = c.consume_string_view();

    if (tag == "info") {
        Info info;
        info.command = c.consume_string();
        info.args = consume_raw(c);
        expect_finished(c, tag);
        return info;
    }

    if (tag == "call" || tag == "cast") {
        std::string mod = c.consume_string();
        std::string fun = c.consume_string();
        std::string args = consume_raw(c);
        expect_finished(c, tag);
        if (tag == "cast")
            return Cast{std::move(mod), std::move(fun), std::move(args)};
        if (mod == ADMIN_MODULE)
            return AdminCall{std::move(fun), std::move(args)};
        return Call{std::move(mod), std::move(fun), std::move(args)};
    }

    throw oxenc::bt_deserialize_invalid{"unknown term type `" + std::string{tag} + "'"};
}

std::string encode_term(const Term& term) {
    return var::visit([](const auto& t) -> std::string {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Call>)
            return encode_action("call", t.module, t.function, t.args);
        else if constexpr (std::is_same_v<T, Cast>)
            return encode_action("cast", t.module, t.function, t.args);
        else if constexpr (std::is_same_v<T, AdminCall>)
            return encode_action("call", ADMIN_MODULE, t.function, t.args);
        else {
            std::string out{"l"};
            out += oxenc::bt_serialize("info"sv);
            out += oxenc::bt_serialize(t.command);
            out += t.args.empty() ? "le"sv : std::string_view{t.args};
            out += 'e';
            return out;
        }
    }, term);
}

std::string encode_reply(std::string_view payload) {
    return oxenc::bt_serialize(oxenc::bt_list{{"reply"sv, payload}});
}

std::string encode_noreply() {
    return oxenc::bt_serialize(oxenc::bt_list{{"noreply"sv}});
}

const std::string& action_module(const Term& term) {
    if (auto* call = std::get_if<Call>(&term))
        return call->module;
    if (auto* cast = std::get_if<Cast>(&term))
        return cast->module;
    throw std::invalid_argument{"term is not a call or cast"};
}

}
