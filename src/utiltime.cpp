// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2022 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "utiltime.h"

#include <chrono>
#include <locale>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>

static boost::mutex cs_clock;
static CClock* processClock = SystemClock::Instance();

void SystemClock::SetGlobal() {
    boost::lock_guard<boost::mutex> lock(cs_clock);
    processClock = SystemClock::Instance();
}

int64_t SystemClock::GetTime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t SystemClock::GetTimeMicros() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
}

void FixedClock::SetGlobal(int64_t nFixedTime) {
    boost::lock_guard<boost::mutex> lock(cs_clock);
    FixedClock::Instance()->Set(nFixedTime);
    processClock = FixedClock::Instance();
}

int64_t FixedClock::GetTime() const {
    return nFixedTime;
}

int64_t FixedClock::GetTimeMicros() const {
    return nFixedTime * 1000000;
}

const CClock& GetClock() {
    boost::lock_guard<boost::mutex> lock(cs_clock);
    return *processClock;
}

int64_t GetTime() {
    return GetClock().GetTime();
}

int64_t GetTimeMicros() {
    return GetClock().GetTimeMicros();
}

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime)
{
    static std::locale classic(std::locale::classic());
    // std::locale takes ownership of the pointer
    std::locale loc(classic, new boost::posix_time::time_facet(pszFormat));
    std::stringstream ss;
    ss.imbue(loc);
    ss << boost::posix_time::from_time_t(nTime);
    return ss.str();
}
