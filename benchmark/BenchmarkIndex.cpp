#include <benchmark/benchmark.h>

#include <map>
#include <string>
#include <vector>

#include "src/CpfIndex/IndexBST.h"
#include "src/CpfIndex/Queries.h"
#include "src/CpfIndex/Record.h"

constexpr int SETUP_ELEMS = 32768;
constexpr int TOTAL_ELEMS = 65536;

using Index = CpfIndex::IndexBST<CpfIndex::Record>;

std::string cpfOf(int num) {
  std::string digits = std::to_string(num);
  return std::string(11 - digits.size(), '0') + digits;
}

void createBalancedInsertion(std::vector<int>& container, int start, int end) {
  if (start > end)
    return;
  int mid = start + (end - start) / 2;
  container.push_back(mid);
  createBalancedInsertion(container, start, mid - 1);
  createBalancedInsertion(container, mid + 1, end);
}

// Record list over keys [offset, offset + count) whose order yields a
// balanced index
std::vector<CpfIndex::Record> createRecords(int count, int offset = 0) {
  std::vector<int> order;
  createBalancedInsertion(order, 0, count - 1);

  std::vector<CpfIndex::Record> records;
  records.reserve(order.size());
  for (const int elem : order)
    records.emplace_back(cpfOf(offset + elem),
                         "Person " + std::to_string(offset + elem),
                         "2000-01-01");
  return records;
}

static void BM_LOOKUP(benchmark::State& state) {
  const std::vector<CpfIndex::Record> records = createRecords(SETUP_ELEMS);
  const Index index{records};
  std::vector<std::string> keys;
  for (int i = 0; i < TOTAL_ELEMS; i++)
    keys.push_back(cpfOf(i));

  for (auto _ : state) {
    for (const std::string& key : keys)
      benchmark::DoNotOptimize(CpfIndex::lookupByKey(index, records, key));
  }
}

static void BM_LOOKUP_STD_MAP(benchmark::State& state) {
  const std::vector<CpfIndex::Record> records = createRecords(SETUP_ELEMS);
  std::map<std::string, std::size_t> index;
  for (std::size_t pos = 0; pos < records.size(); pos++)
    index.emplace(records[pos].cpf, pos);
  std::vector<std::string> keys;
  for (int i = 0; i < TOTAL_ELEMS; i++)
    keys.push_back(cpfOf(i));

  for (auto _ : state) {
    for (const std::string& key : keys) {
      auto it = index.find(key);
      benchmark::DoNotOptimize(it == index.end() ? nullptr
                                                 : &records[it->second]);
    }
  }
}

static void BM_READ_WRITE(benchmark::State& state) {
  const std::vector<CpfIndex::Record> records = createRecords(SETUP_ELEMS);
  Index index{records};
  const std::vector<CpfIndex::Record> extra =
      createRecords(TOTAL_ELEMS, TOTAL_ELEMS);

  for (auto _ : state) {
    for (std::size_t pos = 0; pos < extra.size(); pos++) {
      index.insert(extra[pos], SETUP_ELEMS + pos);
      benchmark::DoNotOptimize(index[extra[pos].cpf]);
      index.remove(extra[pos].cpf);
    }
  }
}

static void BM_MATERIALIZE_SORTED(benchmark::State& state) {
  const std::vector<CpfIndex::Record> records = createRecords(SETUP_ELEMS);
  const Index index{records};

  for (auto _ : state)
    benchmark::DoNotOptimize(CpfIndex::materializeSorted(index, records));
}

static void BM_COPY(benchmark::State& state) {
  const Index index{createRecords(SETUP_ELEMS)};

  for (auto _ : state) {
    Index copy = index.copy();
    benchmark::DoNotOptimize(copy.empty());
  }
}

BENCHMARK(BM_LOOKUP);
BENCHMARK(BM_LOOKUP_STD_MAP);
BENCHMARK(BM_READ_WRITE);
BENCHMARK(BM_MATERIALIZE_SORTED);
BENCHMARK(BM_COPY);
