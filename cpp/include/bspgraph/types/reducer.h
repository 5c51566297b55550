#ifndef BSPGRAPH_TYPES_REDUCER_H
#define BSPGRAPH_TYPES_REDUCER_H

#include <bspgraph/types/value.h>

#include <functional>
#include <string>

namespace bspgraph {

    /**
     * An associative merge of an accumulated value with one update, used by BinaryOperator channels to fold
     * concurrent writes. Writes from sibling tasks are applied in completion order, so a reducer whose result
     * depends on order yields a non-deterministic channel value; commutativity is the caller's concern.
     */
    struct BSPGRAPH_EXPORT Reducer {
        using fn_t = std::function<Value(const Value &acc, const Value &update)>;

        Reducer(std::string name, fn_t fn);

        [[nodiscard]] const std::string &name() const { return _name; }

        /**
         * Applies the reducer. Any exception raised by the function (kind mismatch included) is reported as a
         * ChannelError(INVALID_UPDATE) naming the reducer.
         */
        [[nodiscard]] Value operator()(const Value &acc, const Value &update) const;

    private:
        std::string _name;
        fn_t _fn;
    };

    namespace reducers {
        // Integer when both sides are integers, double otherwise.
        [[nodiscard]] BSPGRAPH_EXPORT Reducer sum();

        [[nodiscard]] BSPGRAPH_EXPORT Reducer max();

        [[nodiscard]] BSPGRAPH_EXPORT Reducer min();

        // List concatenation. A list update is flattened into the accumulator, anything else is appended.
        [[nodiscard]] BSPGRAPH_EXPORT Reducer append();

        // Shallow map merge, keys in the update win.
        [[nodiscard]] BSPGRAPH_EXPORT Reducer merge();

        [[nodiscard]] BSPGRAPH_EXPORT Reducer custom(std::string name, Reducer::fn_t fn);
    } // namespace reducers

} // namespace bspgraph

#endif  // BSPGRAPH_TYPES_REDUCER_H
