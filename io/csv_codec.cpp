#include "io/csv_codec.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>

namespace payments {
namespace io {

namespace {

constexpr std::size_t kTypeField = 0;
constexpr std::size_t kClientField = 1;
constexpr std::size_t kTxField = 2;
constexpr std::size_t kAmountField = 3;

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string_view trim(std::string_view text) {
  const char* kWhitespace = " \t\r\n\v\f";
  const std::size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

template <typename T>
std::optional<T> parseUnsigned(std::string_view text) {
  T value{};
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

ParsedRow failure(std::string message) {
  ParsedRow row;
  row.error = std::move(message);
  return row;
}

}  // namespace

const char* const kTransactionHeader = "type,client,tx,amount";
const char* const kSnapshotHeader = "client,available,held,total,locked";

std::vector<std::string> splitCsvLine(std::string_view line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = line.find(',', start);
    fields.emplace_back(trim(line.substr(start, comma - start)));
    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }
  return fields;
}

ParsedRow parseTransactionFields(const std::vector<std::string>& fields) {
  if (fields.size() <= kTxField) {
    return failure("expected at least 3 fields, got " + std::to_string(fields.size()));
  }

  const auto type = parseTransactionType(fields[kTypeField]);
  if (!type) {
    return failure("unknown transaction type '" + fields[kTypeField] + "'");
  }
  const auto client = parseUnsigned<ClientId>(fields[kClientField]);
  if (!client) {
    return failure("invalid client id '" + fields[kClientField] + "'");
  }
  const auto tx = parseUnsigned<TransactionId>(fields[kTxField]);
  if (!tx) {
    return failure("invalid transaction id '" + fields[kTxField] + "'");
  }

  const std::string empty;
  const std::string& amount_text = fields.size() > kAmountField ? fields[kAmountField] : empty;

  ParsedRow row;
  switch (*type) {
    case TransactionType::DEPOSIT:
    case TransactionType::WITHDRAWAL: {
      if (amount_text.empty()) {
        return failure(std::string(transactionTypeName(*type)) + " tx " + fields[kTxField] +
                       " requires an amount");
      }
      const auto amount = Amount::parse(amount_text);
      if (!amount) {
        return failure("invalid amount '" + amount_text + "'");
      }
      row.record = *type == TransactionType::DEPOSIT
                       ? TransactionRecord::deposit(*client, *tx, *amount)
                       : TransactionRecord::withdrawal(*client, *tx, *amount);
      break;
    }
    case TransactionType::DISPUTE:
    case TransactionType::RESOLVE:
    case TransactionType::CHARGEBACK:
      if (!amount_text.empty()) {
        return failure(std::string(transactionTypeName(*type)) + " tx " + fields[kTxField] +
                       " must not carry an amount");
      }
      if (*type == TransactionType::DISPUTE) {
        row.record = TransactionRecord::dispute(*client, *tx);
      } else if (*type == TransactionType::RESOLVE) {
        row.record = TransactionRecord::resolve(*client, *tx);
      } else {
        row.record = TransactionRecord::chargeback(*client, *tx);
      }
      break;
  }
  return row;
}

TransactionCsvReader::TransactionCsvReader(std::istream& input) : input_(input) {}

bool TransactionCsvReader::next(ParsedRow& row) {
  std::string line;
  while (std::getline(input_, line)) {
    ++line_number_;
    if (line_number_ == 1 && line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
      line.erase(0, kUtf8Bom.size());
    }
    if (trim(line).empty()) {
      continue;
    }

    std::vector<std::string> fields = splitCsvLine(line);
    if (!seen_first_line_) {
      seen_first_line_ = true;
      if (fields[kTypeField] == "type") {
        continue;
      }
    }

    row = parseTransactionFields(fields);
    row.line_number = line_number_;
    return true;
  }

  if (input_.bad()) {
    throw std::runtime_error("I/O error reading input after line " +
                             std::to_string(line_number_));
  }
  return false;
}

std::string formatTransactionRow(const TransactionRecord& record) {
  std::stringstream ss;
  ss << transactionTypeName(record.type()) << ',' << record.client << ',' << record.tx << ',';
  if (auto amount = record.amount()) {
    ss << amount->toString();
  }
  return ss.str();
}

std::string formatSnapshotRow(const AccountSnapshot& row) {
  std::stringstream ss;
  ss << row.client << ',' << row.available.toString() << ',' << row.held.toString() << ','
     << row.total.toString() << ',' << (row.locked ? "true" : "false");
  return ss.str();
}

void writeSnapshotCsv(std::ostream& out, const std::vector<AccountSnapshot>& rows) {
  out << kSnapshotHeader << '\n';
  for (const auto& row : rows) {
    out << formatSnapshotRow(row) << '\n';
  }
  out.flush();
}

}  // namespace io
}  // namespace payments
