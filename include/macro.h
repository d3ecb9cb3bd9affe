#ifndef __heapgraph_macro_h__
#define __heapgraph_macro_h__

/**
 * Evaluates to the value held by \a optional_expr, or runs \a on_nullopt (which must leave the enclosing scope) when
 * it is empty. The expression is evaluated once.
 */
#define unwrap(optional_expr, on_nullopt)                   \
    ({                                                      \
        const auto &__heapgraph_unwrapped = (optional_expr);\
        if (!__heapgraph_unwrapped.has_value()) on_nullopt; \
        *__heapgraph_unwrapped;                             \
    })

// Lets a gtest case reach private members of the declaring class.
#define friend_test(suite, name) friend class suite##_##name##_Test

#endif
