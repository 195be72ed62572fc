#include <iostream>

int test_dice();
int test_economy();
int test_client();
int test_modifiers();
int test_negotiation();
int test_tier();
int test_phases();
int test_config();
int test_achievement();
int test_runner();

int main() {
    int fails = 0;

    fails += test_dice();
    fails += test_economy();
    fails += test_client();
    fails += test_modifiers();
    fails += test_negotiation();
    fails += test_tier();
    fails += test_phases();
    fails += test_config();
    fails += test_achievement();
    fails += test_runner();

    if (fails == 0) {
        std::cout << "[salessim_tests] ALL PASS\n";
        return 0;
    }

    std::cerr << "[salessim_tests] FAILS=" << fails << "\n";
    return 1;
}
