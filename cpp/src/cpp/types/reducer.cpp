#include <bspgraph/types/reducer.h>
#include <bspgraph/util/errors.h>

#include <limits>
#include <stdexcept>

namespace bspgraph {

    Reducer::Reducer(std::string name, fn_t fn) : _name{std::move(name)}, _fn{std::move(fn)} {
        if (!_fn) { throw_error<std::invalid_argument>("Reducer '{}' requires a function", _name); }
    }

    Value Reducer::operator()(const Value &acc, const Value &update) const {
        try {
            return _fn(acc, update);
        } catch (const ChannelError &) {
            throw;
        } catch (const std::exception &e) {
            throw ChannelError{ChannelError::Kind::INVALID_UPDATE,
                               fmt::format("reducer '{}' rejected {} into {}: {}", _name, update, acc, e.what())};
        }
    }

    namespace reducers {
        namespace {
            void require_numbers(const char *name, const Value &acc, const Value &update) {
                if (!acc.is_number() || !update.is_number()) {
                    throw_error<std::invalid_argument>("{} expects numbers, got {} and {}", name, acc.kind(),
                                                       update.kind());
                }
            }
        } // namespace

        Reducer sum() {
            return Reducer{"sum", [](const Value &acc, const Value &update) {
                require_numbers("sum", acc, update);
                if (acc.is_int() && update.is_int()) {
                    const auto a = acc.as_int();
                    const auto b = update.as_int();
                    using limits = std::numeric_limits<int64_t>;
                    if ((b > 0 && a > limits::max() - b) || (b < 0 && a < limits::min() - b)) {
                        throw_error<std::overflow_error>("sum of {} and {} overflows a 64 bit integer", a, b);
                    }
                    return Value{a + b};
                }
                return Value{acc.as_number() + update.as_number()};
            }};
        }

        Reducer max() {
            return Reducer{"max", [](const Value &acc, const Value &update) {
                require_numbers("max", acc, update);
                return update.as_number() > acc.as_number() ? update : acc;
            }};
        }

        Reducer min() {
            return Reducer{"min", [](const Value &acc, const Value &update) {
                require_numbers("min", acc, update);
                return update.as_number() < acc.as_number() ? update : acc;
            }};
        }

        Reducer append() {
            return Reducer{"append", [](const Value &acc, const Value &update) {
                Value::list_t result;
                if (acc.is_list()) {
                    result = acc.as_list();
                } else if (!acc.is_none()) {
                    result.push_back(acc);
                }
                if (update.is_list()) {
                    result.insert(result.end(), update.as_list().begin(), update.as_list().end());
                } else {
                    result.push_back(update);
                }
                return Value{std::move(result)};
            }};
        }

        Reducer merge() {
            return Reducer{"merge", [](const Value &acc, const Value &update) {
                if (acc.is_none()) { return Value{update.as_map()}; }
                auto result = acc.as_map();
                for (const auto &[key, item]: update.as_map()) { result.insert_or_assign(key, item); }
                return Value{std::move(result)};
            }};
        }

        Reducer custom(std::string name, Reducer::fn_t fn) { return Reducer{std::move(name), std::move(fn)}; }
    } // namespace reducers

} // namespace bspgraph
