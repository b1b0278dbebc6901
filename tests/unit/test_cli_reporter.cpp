#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <catch2/catch_test_case_info.hpp>
#include <catch2/interfaces/catch_interfaces_reporter.hpp>

#include <iostream>

// Prints one line per finished test so CTest logs show which gateway area failed.
class GatewayTestOutcomePrinter : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testCaseEnded(Catch::TestCaseStats const& stats) override {
        const auto& assertions = stats.totals.assertions;
        std::cout << (assertions.failed > 0 ? "[FAIL] " : "[ OK ] ") << stats.testInfo->name;
        if (assertions.failed > 0) {
            std::cout << " (" << assertions.failed << " of " << assertions.total() << " assertions failed)";
        }
        std::cout << std::endl;
    }
};

CATCH_REGISTER_LISTENER(GatewayTestOutcomePrinter)
