#define ITERMORE_FN_ENABLE_RUN_TESTS 1

#include <itermore/fn.hpp>

int main()
{
#if ITERMORE_FN_ENABLE_RUN_TESTS
    itermore::fn::impl::run_tests(); // throws if any test failed
#endif

    return 0;
}
