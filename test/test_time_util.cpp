#include <cassert>
#include <cstdio>
#include <cmath>
#include "util/TimeUtil.h"

void test_parse_timemark() {
    assert(std::abs(TimeUtil::parseTimemark("00:00:05.50") - 5.5) < 1e-9);
    assert(std::abs(TimeUtil::parseTimemark("01:02:03.250000") - 3723.25) < 1e-9);
    assert(std::abs(TimeUtil::parseTimemark(" 00:01:00 ") - 60.0) < 1e-9);
    printf("PASS: test_parse_timemark\n");
}

void test_parse_timemark_malformed() {
    assert(TimeUtil::parseTimemark("") < 0);
    assert(TimeUtil::parseTimemark("N/A") < 0);
    assert(TimeUtil::parseTimemark("00:05.5") < 0);
    assert(TimeUtil::parseTimemark("-00:00:01") < 0);
    assert(TimeUtil::parseTimemark("aa:bb:cc") < 0);
    printf("PASS: test_parse_timemark_malformed\n");
}

void test_seconds_to_hms_ms() {
    assert(TimeUtil::secondsToHMSms(3661.5) == "01:01:01.500");
    assert(TimeUtil::secondsToHMSms(0.0) == "00:00:00.000");
    printf("PASS: test_seconds_to_hms_ms\n");
}

int main() {
    test_parse_timemark();
    test_parse_timemark_malformed();
    test_seconds_to_hms_ms();
    printf("All time util tests passed.\n");
    return 0;
}
