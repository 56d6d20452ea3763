#pragma once
#include <functional>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace xgear {
// single-resolution completion handle
// copies share the same state, so settle methods are const
template <class T>
class Eventual {
  public:
    using ValueCallback = std::function<void(const T&)>;
    using ErrorCallback = std::function<void(const Error&)>;

  private:
    struct Continuation {
        ValueCallback on_value;
        ErrorCallback on_error;
    };
    // index 0: pending, 1: resolved, 2: rejected
    using Outcome = std::variant<std::monostate, T, Error>;

    struct State {
        Outcome                   outcome;
        std::vector<Continuation> continuations;
    };

    std::shared_ptr<State> state = std::make_shared<State>();

    static auto run(const State& state, const Continuation& c) -> void {
        if(const auto value = std::get_if<1>(&state.outcome); value != nullptr) {
            if(c.on_value) {
                c.on_value(*value);
            }
        } else if(const auto error = std::get_if<2>(&state.outcome); error != nullptr) {
            if(c.on_error) {
                c.on_error(*error);
            }
        }
    }
    auto settle(Outcome outcome) const -> bool {
        const auto keep = state;
        if(keep->outcome.index() != 0) {
            return false;
        }
        keep->outcome      = std::move(outcome);
        auto continuations = std::exchange(keep->continuations, {});
        for(const auto& c : continuations) {
            run(*keep, c);
        }
        return true;
    }

  public:
    // false if already settled, the first outcome is kept
    auto resolve(T value) const -> bool {
        return settle(Outcome(std::in_place_index<1>, std::move(value)));
    }
    auto reject(Error error) const -> bool {
        return settle(Outcome(std::in_place_index<2>, std::move(error)));
    }
    // runs immediately when already settled
    auto then(ValueCallback on_value, ErrorCallback on_error = nullptr) const -> void {
        auto c = Continuation{std::move(on_value), std::move(on_error)};
        if(state->outcome.index() == 0) {
            state->continuations.emplace_back(std::move(c));
        } else {
            run(*state, c);
        }
    }
    auto is_settled() const -> bool {
        return state->outcome.index() != 0;
    }
    auto is_resolved() const -> bool {
        return state->outcome.index() == 1;
    }
    auto is_rejected() const -> bool {
        return state->outcome.index() == 2;
    }
    auto get_value() const -> const T* {
        return std::get_if<1>(&state->outcome);
    }
    auto get_error() const -> const Error* {
        return std::get_if<2>(&state->outcome);
    }
    auto shares_state(const Eventual& o) const -> bool {
        return state == o.state;
    }

    static auto rejected(Error error) -> Eventual {
        auto r = Eventual();
        r.reject(std::move(error));
        return r;
    }
};

using Trigger = Eventual<std::monostate>;
} // namespace xgear
