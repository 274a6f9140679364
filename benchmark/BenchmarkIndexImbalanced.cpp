#include <benchmark/benchmark.h>

#include <map>
#include <string>
#include <vector>

#include "src/CpfIndex/IndexBST.h"
#include "src/CpfIndex/Record.h"

// Sequential keys turn the index into a right chain, keep this small
constexpr int SETUP_ELEMS = 4096;

using Index = CpfIndex::IndexBST<CpfIndex::Record>;

std::string cpfOf(int num) {
  std::string digits = std::to_string(num);
  return std::string(11 - digits.size(), '0') + digits;
}

std::vector<CpfIndex::Record> createSequentialRecords(int count) {
  std::vector<CpfIndex::Record> records;
  records.reserve(count);
  for (int i = 0; i < count; i++)
    records.emplace_back(cpfOf(i), "Person " + std::to_string(i),
                         "2000-01-01");
  return records;
}

static void BM_READ_INTENSIVE_IMBALANCED(benchmark::State& state) {
  const Index index{createSequentialRecords(SETUP_ELEMS)};

  for (auto _ : state) {
    for (int i = 0; i < SETUP_ELEMS; i++)
      benchmark::DoNotOptimize(index.search(cpfOf(i)));
  }
}

static void BM_READ_INTENSIVE_IMBALANCED_STD_MAP(benchmark::State& state) {
  std::map<std::string, std::size_t> index;
  for (int i = 0; i < SETUP_ELEMS; i++)
    index.emplace(cpfOf(i), i);

  for (auto _ : state) {
    for (int i = 0; i < SETUP_ELEMS; i++)
      benchmark::DoNotOptimize(index.find(cpfOf(i)) != index.end());
  }
}

static void BM_WRITE_INTENSIVE_IMBALANCED(benchmark::State& state) {
  const std::vector<CpfIndex::Record> records =
      createSequentialRecords(SETUP_ELEMS);

  for (auto _ : state) {
    Index index{records};
    for (const CpfIndex::Record& record : records)
      index.remove(record.cpf);
    benchmark::DoNotOptimize(index.empty());
  }
}

static void BM_TRAVERSE_IMBALANCED(benchmark::State& state) {
  const Index index{createSequentialRecords(SETUP_ELEMS)};
  const auto order = static_cast<CpfIndex::TraversalOrder>(state.range(0));

  for (auto _ : state)
    benchmark::DoNotOptimize(index.traverse(order));
}

BENCHMARK(BM_READ_INTENSIVE_IMBALANCED);
BENCHMARK(BM_READ_INTENSIVE_IMBALANCED_STD_MAP);
BENCHMARK(BM_WRITE_INTENSIVE_IMBALANCED);
BENCHMARK(BM_TRAVERSE_IMBALANCED)->DenseRange(0, 3);
