#ifndef CSV_CODEC_HPP_
#define CSV_CODEC_HPP_

#include "snapshot.hpp"
#include "transaction.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace payments {
namespace io {

// Splits one line on commas and trims surrounding whitespace from each field.
std::vector<std::string> splitCsvLine(std::string_view line);

/**
 * Result of decoding one data row: either a record or a parse error message.
 */
struct ParsedRow {
  std::size_t line_number = 0;
  std::optional<TransactionRecord> record;
  std::string error;
};

/**
 * Decodes `type,client,tx[,amount[,...]]` fields into a record.
 * Extra trailing fields are ignored.
 */
ParsedRow parseTransactionFields(const std::vector<std::string>& fields);

/**
 * Streams transaction records out of `type,client,tx,amount` text.
 * The header line is skipped, blank lines are ignored.
 */
class TransactionCsvReader {
 public:
  explicit TransactionCsvReader(std::istream& input);

  /**
   * Reads the next data row into `row`. Returns false at end of input.
   * Throws std::runtime_error if the underlying stream fails.
   */
  bool next(ParsedRow& row);

  std::size_t linesRead() const { return line_number_; }

 private:
  std::istream& input_;
  std::size_t line_number_ = 0;
  bool seen_first_line_ = false;
};

// "type,client,tx,amount"
extern const char* const kTransactionHeader;

// Input-format row, e.g. "deposit,1,1,100.0000" or "dispute,1,1,".
std::string formatTransactionRow(const TransactionRecord& record);

// "client,available,held,total,locked"
extern const char* const kSnapshotHeader;

// One output row, e.g. "1,74.5000,0.0000,74.5000,false".
std::string formatSnapshotRow(const AccountSnapshot& row);

// Header followed by one line per row.
void writeSnapshotCsv(std::ostream& out, const std::vector<AccountSnapshot>& rows);

}  // namespace io
}  // namespace payments

#endif  // CSV_CODEC_HPP_
