// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2019-2022 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_UTILTIME_H
#define SHIELDPOOL_UTILTIME_H

#include <stdint.h>
#include <string>

class CClock {
public:
    /** Returns the current time in seconds since the POSIX epoch. */
    virtual int64_t GetTime() const = 0;
    /** Returns the current time in microseconds since the POSIX epoch. */
    virtual int64_t GetTimeMicros() const = 0;
};

class SystemClock: public CClock {
private:
    SystemClock() {}
    ~SystemClock() {}
    SystemClock(SystemClock const&)    = delete;
    SystemClock& operator=(const SystemClock&)= delete;
public:
    static SystemClock* Instance() {
        static SystemClock instance;
        return &instance;
    }

    /** Sets the process clock to the system clock. */
    static void SetGlobal();

    int64_t GetTime() const;
    int64_t GetTimeMicros() const;
};

/**
 * A clock pinned to one timestamp. Spent-nullifier records and receipts
 * carry the clock's time, so tests pin it to get stable records.
 */
class FixedClock: public CClock {
private:
    int64_t nFixedTime;

    FixedClock(): nFixedTime(0) {}
    ~FixedClock() {}
    FixedClock(FixedClock const&)    = delete;
    FixedClock& operator=(const FixedClock&)= delete;

    void Set(int64_t nFixedTime) {
        this->nFixedTime = nFixedTime;
    }
public:
    static FixedClock* Instance() {
        static FixedClock instance;
        return &instance;
    }

    static void SetGlobal(int64_t nFixedTime);

    int64_t GetTime() const;
    int64_t GetTimeMicros() const;
};

const CClock& GetClock();

int64_t GetTime();
int64_t GetTimeMicros();

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

#endif // SHIELDPOOL_UTILTIME_H
