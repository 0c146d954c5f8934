/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include "gsched/String.h"

using namespace gsched;

TEST(PARSE_INDEX_LIST, ranges_and_singles) {
  auto indices = util::ParseIndexList("0-3,6");
  ASSERT_TRUE(indices.has_value());
  std::set<gpu_index_t> answer{0, 1, 2, 3, 6};
  ASSERT_EQ(indices.value(), answer);

  indices = util::ParseIndexList(" 7 , 2-2 ");
  ASSERT_TRUE(indices.has_value());
  answer = {2, 7};
  ASSERT_EQ(indices.value(), answer);

  indices = util::ParseIndexList("");
  ASSERT_TRUE(indices.has_value());
  ASSERT_TRUE(indices->empty());
}

TEST(PARSE_INDEX_LIST, illegal) {
  for (const char* str : {"3-1", "a", "1,,2", "-1", "0-"}) {
    auto indices = util::ParseIndexList(str);
    ASSERT_FALSE(indices.has_value()) << str;
    ASSERT_EQ(indices.error().code(), GschedErrCode::ERR_INVALID_PARAM);
  }
}

TEST(PARSE_INDEX_LIST, wide_ranges) {
  auto indices = util::ParseIndexList("0-1023");
  ASSERT_TRUE(indices.has_value());
  ASSERT_EQ(indices->size(), 1024U);

  for (const char* str :
       {"0-1024", "0-4294967295", "4294967295-4294967295,0-2000"}) {
    auto wide = util::ParseIndexList(str);
    ASSERT_FALSE(wide.has_value()) << str;
    ASSERT_EQ(wide.error().code(), GschedErrCode::ERR_INVALID_PARAM);
  }

  indices = util::ParseIndexList("4294967295");
  ASSERT_TRUE(indices.has_value());
  ASSERT_EQ(*indices->begin(), 4294967295U);
}

TEST(INDEX_LIST_TO_STR, folds_runs) {
  ASSERT_EQ(util::IndexListToStr({0, 1, 2, 3, 6}), "0-3,6");
  ASSERT_EQ(util::IndexListToStr({5}), "5");
  ASSERT_EQ(util::IndexListToStr({1, 3, 4}), "1,3-4");
  ASSERT_EQ(util::IndexListToStr({}), "");
}

TEST(PARSE_HOST_LIST, brackets) {
  std::list<std::string> hosts;
  ASSERT_TRUE(util::ParseHostList("cn[01-03,07],login", &hosts));

  std::list<std::string> answer{"cn01", "cn02", "cn03", "cn07", "login"};
  ASSERT_EQ(hosts, answer);
}

TEST(PARSE_HOST_LIST, suffix_after_bracket) {
  std::list<std::string> hosts;
  ASSERT_TRUE(util::ParseHostList("gpu[1-2].lab", &hosts));

  std::list<std::string> answer{"gpu1.lab", "gpu2.lab"};
  ASSERT_EQ(hosts, answer);
}

TEST(PARSE_HOST_LIST, illegal) {
  std::list<std::string> hosts;
  ASSERT_FALSE(util::ParseHostList("cn[01-03", &hosts));
  ASSERT_FALSE(util::ParseHostList("cn[[1]]", &hosts));
  ASSERT_FALSE(util::ParseHostList("cn[3-1]", &hosts));
}

TEST(PARSE_HOST_LIST, wide_ranges) {
  std::list<std::string> hosts;
  ASSERT_FALSE(util::ParseHostList("cn[0-18446744073709551615]", &hosts));
  ASSERT_FALSE(
      util::ParseHostList("cn[18446744073709551614-18446744073709551615,"
                          "0-65536]",
                          &hosts));

  hosts.clear();
  ASSERT_TRUE(
      util::ParseHostList("cn[18446744073709551614-18446744073709551615]",
                          &hosts));
  std::list<std::string> answer{"cn18446744073709551614",
                                "cn18446744073709551615"};
  ASSERT_EQ(hosts, answer);
}

TEST(PARSE_MEMORY, units) {
  ASSERT_EQ(util::ParseMemory("512").value(), 512U);
  ASSERT_EQ(util::ParseMemory("2K").value(), 2048U);
  ASSERT_EQ(util::ParseMemory("50M").value(), 50U * 1024 * 1024);
  ASSERT_EQ(util::ParseMemory("1G").value(), 1024U * 1024 * 1024);
  ASSERT_FALSE(util::ParseMemory("ten").has_value());
}

TEST(PARSE_MEMORY, overflow) {
  ASSERT_EQ(util::ParseMemory("17179869183G").value(),
            17179869183ULL * 1024 * 1024 * 1024);

  for (const char* str : {"17179869184G", "18014398509481984K",
                          "99999999999999999999"}) {
    auto mem = util::ParseMemory(str);
    ASSERT_FALSE(mem.has_value()) << str;
    ASSERT_EQ(mem.error().code(), GschedErrCode::ERR_INVALID_PARAM);
  }
}

TEST(READABLE_UNIX_TIME, utc) {
  ASSERT_EQ(util::ReadableUnixTime(0.0), "1970-01-01T00:00:00.000000Z");
  ASSERT_EQ(util::ReadableUnixTime(1.5), "1970-01-01T00:00:01.500000Z");
}
