// Copyright (c) 2025-2026 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_TOOL_TOOL_HPP
#define LSYSGEN_TOOL_TOOL_HPP

#include "../runtime/Derivation.hpp"
#include "../runtime/Engine.hpp"
#include "../runtime/Grammar.hpp"
#include "../runtime/Symbol.hpp"
#include "../util/random.hpp"

#include <xxhash.h>

#include <list>
#include <set>
#include <string>

namespace lsysgen {
namespace tool {

/*
 * Shared machinery of the command line tools: derives a grammar with the
 * configured depth, turns the result into text and remembers what it has
 * already produced.
 */
class Tool {
public:
  using SerializerFn = std::string (*)(const runtime::Generation&);

  const runtime::Grammar& grammar;
  const runtime::Engine& engine;
  SerializerFn serializer;
  int generations;
  int max_generations;
  bool all_generations;

protected:
  int memo_size;
  std::set<XXH64_hash_t> memo;
  std::list<std::set<XXH64_hash_t>::iterator> memo_order;

public:
  // A negative `generations` means expanding until a fixed point, but at
  // most `max_generations` times. With `all_generations`, every generation
  // (the axiom included) is serialized on a line of its own.
  Tool(const runtime::Grammar& grammar, const runtime::Engine& engine, SerializerFn serializer,
       int generations = -1, int max_generations = 64, bool all_generations = false, int memo_size = 0)
      : grammar(grammar), engine(engine), serializer(serializer), generations(generations),
        max_generations(max_generations), all_generations(all_generations), memo_size(memo_size) { }

  Tool(const Tool& other) = delete;
  Tool& operator=(const Tool& other) = delete;
  Tool(Tool&& other) = delete;
  Tool& operator=(Tool&& other) = delete;
  virtual ~Tool() = default;

  std::string derive(util::RandomSource& random) const {
    runtime::Derivation derivation(engine, grammar, random);
    if (!all_generations) {
      return serializer(generations >= 0 ? derivation.run(generations) : derivation.realize(max_generations));
    }

    std::string text = serializer(derivation.current());
    int limit = generations >= 0 ? generations : max_generations;
    while (derivation.index() < limit) {
      bool changed = derivation.next();
      if (!changed && generations < 0) {
        break;
      }
      text += "\n" + serializer(derivation.current());
    }
    return text;
  }

  bool memoize_test(const void *input, size_t length) {
    // Memoize the (hash of the) test case. The size of the memo is capped by
    // ``memo_size``, i.e., it contains at most that many test cases.
    // Returns ``false`` if the test case was already in the memo, ``true``
    // if it got added now (or memoization is disabled by ``memo_size=0``).
    // When the memo is full and a new test case is added, the oldest entry
    // is evicted.
    if (memo_size < 1) {
      return true;
    }

    auto test = XXH3_64bits(input, length);
    auto inserted = memo.insert(test);  // {iterator, success}
    if (!inserted.second) {
      return false;
    }
    memo_order.push_back(inserted.first);

    if (memo.size() > static_cast<size_t>(memo_size)) {
      memo.erase(memo_order.front());
      memo_order.pop_front();
    }

    return true;
  }
};

} // namespace tool
} // namespace lsysgen

#endif // LSYSGEN_TOOL_TOOL_HPP
