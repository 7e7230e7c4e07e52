/*
 * libjingle
 * Copyright 2004--2005, Google Inc.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  1. Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *  2. Redistributions in binary form must reproduce the above copyright notice,
 *     this list of conditions and the following disclaimer in the documentation
 *     and/or other materials provided with the distribution.
 *  3. The name of the author may not be used to endorse or promote products
 *     derived from this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED
 * WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO
 * EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <thread>
#include <vector>

#include "jbrowse/base/atomicops.h"
#include "jbrowse/base/gunit.h"

namespace jbrowse_base {

TEST(AtomicOpsTest, IncrementAndDecrement) {
  volatile int counter = 0;
  EXPECT_EQ(1, AtomicOps::Increment(&counter));
  EXPECT_EQ(2, AtomicOps::Increment(&counter));
  EXPECT_EQ(1, AtomicOps::Decrement(&counter));
  EXPECT_EQ(0, AtomicOps::Decrement(&counter));
  EXPECT_EQ(-1, AtomicOps::Decrement(&counter));
}

TEST(AtomicOpsTest, LoadAndStore) {
  volatile int value = 0;
  AtomicOps::ReleaseStore(&value, 42);
  EXPECT_EQ(42, AtomicOps::AcquireLoad(&value));
}

static void IncrementMany(volatile int* counter, int times) {
  for (int i = 0; i < times; ++i)
    AtomicOps::Increment(counter);
}

TEST(AtomicOpsTest, ConcurrentIncrementsAreNotLost) {
  const int kThreads = 4;
  const int kIncrements = 10000;
  volatile int counter = 0;

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i)
    threads.push_back(std::thread(IncrementMany, &counter, kIncrements));
  for (size_t i = 0; i < threads.size(); ++i)
    threads[i].join();

  EXPECT_EQ(kThreads * kIncrements, AtomicOps::AcquireLoad(&counter));
}

}  // namespace jbrowse_base
