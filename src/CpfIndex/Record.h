#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace CpfIndex {
struct Record {
  using key_type = std::string;

  std::string cpf;
  std::string name;
  std::string birthDate;
  bool deleted = false;  // Owned by the record list, never written by the index

  Record() = default;
  Record(std::string cpf, std::string name, std::string birthDate)
      : cpf{std::move(cpf)},
        name{std::move(name)},
        birthDate{std::move(birthDate)} {}

  const std::string& key() const { return cpf; }

  friend bool operator<(const Record& lhs, const Record& rhs) {
    return lhs.cpf < rhs.cpf;
  }

  friend bool operator==(const Record& lhs, const Record& rhs) {
    return lhs.cpf == rhs.cpf;
  }
};

inline std::ostream& operator<<(std::ostream& os, const Record& record) {
  return os << "CPF: " << record.cpf << ", Name: " << record.name
            << ", Birth date: " << record.birthDate;
}
}  // namespace CpfIndex
