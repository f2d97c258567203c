#include "command.hpp"
#include "general/errors.hpp"
#include <utility>

namespace script {
namespace {
    constexpr std::string_view whitespace { " \t\r\n" };

    std::string_view trim(std::string_view s)
    {
        auto begin { s.find_first_not_of(whitespace) };
        if (begin == std::string_view::npos)
            return {};
        auto end { s.find_last_not_of(whitespace) };
        return s.substr(begin, end - begin + 1);
    }

    class Tokenizer {
    public:
        Tokenizer(std::string_view line)
            : rest(trim(line))
        {
        }

        std::optional<std::string_view> next()
        {
            if (rest.empty())
                return {};
            auto end { rest.find_first_of(whitespace) };
            auto token { rest.substr(0, end) };
            rest = end == std::string_view::npos ? std::string_view {} : trim(rest.substr(end));
            return token;
        }
        std::string_view required()
        {
            if (auto t { next() })
                return *t;
            throw Error(EINV_ARGS);
        }
        std::string_view remainder()
        {
            return std::exchange(rest, {});
        }
        void expect_end() const
        {
            if (!rest.empty())
                throw Error(EINV_ARGS);
        }

        Address address() { return Address(required()); }
        TokenId token_id() { return TokenId::parse_throw(required()); }
        InterfaceId interface_id() { return InterfaceId::parse_throw(required()); }
        bool boolean()
        {
            auto t { required() };
            if (t == "true")
                return true;
            if (t == "false")
                return false;
            throw Error(EBADBOOL);
        }

    private:
        std::string_view rest;
    };

    template <typename T>
    T parse_args(Tokenizer& t);

    template <>
    command::Mint parse_args<command::Mint>(Tokenizer& t)
    {
        // uri is optional and may contain whitespace
        return { t.address(), t.token_id(), std::string(t.remainder()) };
    }

    template <>
    command::Transfer parse_args<command::Transfer>(Tokenizer& t)
    {
        command::Transfer c { t.address(), t.address(), t.address(), t.token_id() };
        t.expect_end();
        return c;
    }

    template <>
    command::Approve parse_args<command::Approve>(Tokenizer& t)
    {
        command::Approve c { t.address(), t.address(), t.token_id() };
        t.expect_end();
        return c;
    }

    template <>
    command::ApproveAll parse_args<command::ApproveAll>(Tokenizer& t)
    {
        command::ApproveAll c { t.address(), t.address(), t.boolean() };
        t.expect_end();
        return c;
    }

    template <>
    command::Burn parse_args<command::Burn>(Tokenizer& t)
    {
        command::Burn c { t.address(), t.token_id() };
        t.expect_end();
        return c;
    }

    template <>
    command::BalanceOf parse_args<command::BalanceOf>(Tokenizer& t)
    {
        command::BalanceOf c { t.address() };
        t.expect_end();
        return c;
    }

    template <>
    command::IsApprovedForAll parse_args<command::IsApprovedForAll>(Tokenizer& t)
    {
        command::IsApprovedForAll c { t.address(), t.address() };
        t.expect_end();
        return c;
    }

    template <>
    command::SupportsInterface parse_args<command::SupportsInterface>(Tokenizer& t)
    {
        command::SupportsInterface c { t.interface_id() };
        t.expect_end();
        return c;
    }

    // commands taking a single token id
    template <typename T>
    requires requires(T c) { c.tokenId; }
    T parse_token_query(Tokenizer& t)
    {
        T c { t.token_id() };
        t.expect_end();
        return c;
    }
    template <>
    command::OwnerOf parse_args<command::OwnerOf>(Tokenizer& t) { return parse_token_query<command::OwnerOf>(t); }
    template <>
    command::GetApproved parse_args<command::GetApproved>(Tokenizer& t) { return parse_token_query<command::GetApproved>(t); }
    template <>
    command::TokenUri parse_args<command::TokenUri>(Tokenizer& t) { return parse_token_query<command::TokenUri>(t); }
    template <>
    command::Exists parse_args<command::Exists>(Tokenizer& t) { return parse_token_query<command::Exists>(t); }

    // commands without arguments
    template <typename T>
    T parse_no_args(Tokenizer& t)
    {
        t.expect_end();
        return {};
    }
    template <>
    command::TotalSupply parse_args<command::TotalSupply>(Tokenizer& t) { return parse_no_args<command::TotalSupply>(t); }
    template <>
    command::Name parse_args<command::Name>(Tokenizer& t) { return parse_no_args<command::Name>(t); }
    template <>
    command::Symbol parse_args<command::Symbol>(Tokenizer& t) { return parse_no_args<command::Symbol>(t); }

    template <typename... Ts>
    std::optional<Command> dispatch(std::string_view name, Tokenizer& t, std::variant<Ts...>*)
    {
        std::optional<Command> res;
        ((Ts::name == name ? (res = parse_args<Ts>(t), true) : false) || ...);
        return res;
    }
}

std::optional<Command> parse_line(std::string_view line)
{
    Tokenizer t(line);
    auto name { t.next() };
    if (!name || name->starts_with('#'))
        return {};
    if (auto c { dispatch(*name, t, static_cast<Command*>(nullptr)) })
        return c;
    throw Error(EINV_COMMAND);
}
}
