#include <sum-core/result.hh>
#include <sum-core/to_string.hh>


struct sc::any_error::context_node
{
    std::string message;
    sc::source_location site;
    std::unique_ptr<context_node> next;

    context_node(std::string msg, sc::source_location s) : message(sc::move(msg)), site(s) {}
};

struct sc::any_error::payload
{
    std::string message;
    sc::source_location site;

    // newest context first
    std::unique_ptr<context_node> ctx;

    payload(std::string msg, sc::source_location s) : message(sc::move(msg)), site(s) {}
};

namespace
{
void append_site(std::string& s, sc::source_location const& site)
{
    s += site.file_name();
    s += ":";
    s += sc::to_string(site.line());
    s += " - ";
    s += site.function_name();
}
} // namespace

sc::any_error::any_error(std::string message, sc::source_location site)
  : _payload(std::make_unique<payload>(sc::move(message), site))
{
}

sc::any_error::any_error(char const* message, sc::source_location site) : any_error(std::string(message), site) {}

sc::any_error::any_error(any_error const& rhs)
{
    if (!rhs._payload)
        return;

    _payload = std::make_unique<payload>(rhs._payload->message, rhs._payload->site);

    // deep copy of the context chain, order preserved
    auto* tail = &_payload->ctx;
    for (auto const* c = rhs._payload->ctx.get(); c != nullptr; c = c->next.get())
    {
        *tail = std::make_unique<context_node>(c->message, c->site);
        tail = &(*tail)->next;
    }
}

sc::any_error& sc::any_error::operator=(any_error const& rhs)
{
    if (this != &rhs)
        *this = any_error(rhs);
    return *this;
}

// must be defined here because payload is only fwd declared in any_error
sc::any_error::any_error(any_error&& rhs) noexcept = default;
sc::any_error& sc::any_error::operator=(any_error&& rhs) noexcept
{
    if (this != &rhs)
    {
        impl_release_chain();
        _payload = sc::move(rhs._payload);
    }
    return *this;
}

sc::any_error::~any_error()
{
    impl_release_chain();
}

void sc::any_error::impl_release_chain() noexcept
{
    if (!_payload)
        return;

    auto next = sc::move(_payload->ctx);
    while (next)
        next = sc::move(next->next);
}

void sc::any_error::impl_ensure_payload()
{
    if (_payload)
        return;

    _payload = std::make_unique<payload>("<empty sc::any_error>", sc::source_location::current());
}

sc::any_error& sc::any_error::add_context(std::string message, sc::source_location site) &
{
    this->impl_ensure_payload();

    auto new_ctx = std::make_unique<context_node>(sc::move(message), site);
    new_ctx->next = sc::move(_payload->ctx);
    _payload->ctx = sc::move(new_ctx);
    return *this;
}

sc::any_error sc::any_error::with_context(std::string message, sc::source_location site) &&
{
    add_context(sc::move(message), site);
    return sc::move(*this);
}

bool sc::any_error::is_empty() const
{
    return _payload == nullptr;
}

std::string_view sc::any_error::message() const
{
    return _payload ? std::string_view(_payload->message) : std::string_view();
}

sc::source_location sc::any_error::site() const
{
    return _payload ? _payload->site : sc::source_location::current();
}

sc::isize sc::any_error::context_count() const
{
    if (!_payload)
        return 0;

    isize count = 0;
    for (auto const* c = _payload->ctx.get(); c != nullptr; c = c->next.get())
        ++count;
    return count;
}

std::string sc::any_error::to_string() const
{
    if (!_payload)
        return "error: <empty sc::any_error>\n";

    std::string result;

    result += "error: ";
    result += _payload->message;
    result += "\n";

    result += "  at ";
    append_site(result, _payload->site);
    result += "\n";

    for (auto const* c = _payload->ctx.get(); c != nullptr; c = c->next.get())
    {
        result += "  context: ";
        result += c->message;
        result += " (at ";
        append_site(result, c->site);
        result += ")\n";
    }

    return result;
}
