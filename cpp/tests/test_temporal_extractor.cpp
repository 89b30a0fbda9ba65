#include "tkgstats/data/dataset_type.hpp"
#include "tkgstats/data/triple_reader.hpp"
#include "tkgstats/processing/temporal_extractor.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using tkgstats::DatasetType;
using tkgstats::Date;
using tkgstats::TemporalExtractor;
using tkgstats::TemporalFields;

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

TemporalFields extract_line(std::string_view line, DatasetType type) {
  return TemporalExtractor::extract(tkgstats::TripleReader::split_line(line, '\t'), type);
}

void test_classify_dataset() {
  check(tkgstats::classify_dataset("ICEWS14") == DatasetType::EVENT_CALENDAR, "icews is event calendar");
  check(tkgstats::classify_dataset("icews05-15") == DatasetType::EVENT_CALENDAR, "icews05-15 is event calendar");
  check(tkgstats::classify_dataset("Wikidata12k") == DatasetType::LINKED_DATA, "wikidata is linked data");
  check(tkgstats::classify_dataset("YAGO11k") == DatasetType::FACT_EXTRACTION, "yago is fact extraction");
  check(tkgstats::classify_dataset("gdelt") == DatasetType::GENERIC, "unknown name is generic");
  check(tkgstats::classify_dataset("") == DatasetType::GENERIC, "empty name is generic");
  // Priority order: the first convention wins
  check(tkgstats::classify_dataset("yago_wikidata_mix") == DatasetType::LINKED_DATA, "wikidata checked before yago");
  check(std::string(tkgstats::dataset_type_name(DatasetType::FACT_EXTRACTION)) == "fact_extraction",
        "type name");
}

void test_event_calendar_date() {
  const auto fields = extract_line("A\trel\tB\t2010-05-01", DatasetType::EVENT_CALENDAR);
  check(fields.date.has_value() && *fields.date == Date(2010, 5, 1), "date parsed");
  check(fields.year == 2010, "year taken from date");
  check(!fields.marker.has_value(), "event calendar rows carry no marker");
  check(!fields.is_temporal_record(), "date alone is not a temporal record");
}

void test_event_calendar_invalid_dates() {
  check(extract_line("A\trel\tB\t2010-13-01", DatasetType::EVENT_CALENDAR).empty(), "month 13 rejected");
  check(extract_line("A\trel\tB\t2011-02-29", DatasetType::EVENT_CALENDAR).empty(), "non-leap Feb 29 rejected");
  check(extract_line("A\trel\tB\t2010-05-01T00", DatasetType::EVENT_CALENDAR).empty(), "trailing text rejected");
  check(extract_line("A\trel\tB\t10-05-01", DatasetType::EVENT_CALENDAR).empty(), "short year rejected");
  check(extract_line("A\trel\tB", DatasetType::EVENT_CALENDAR).empty(), "missing date column");

  const auto leap = extract_line("A\trel\tB\t2012-02-29", DatasetType::EVENT_CALENDAR);
  check(leap.date == Date(2012, 2, 29), "leap day accepted");

  const auto short_fields = TemporalExtractor::parse_date("2014-1-9");
  check(short_fields == Date(2014, 1, 9), "single digit month and day accepted");
}

void test_linked_data() {
  const auto fields = extract_line("A\trel\tB\tsince\t1990", DatasetType::LINKED_DATA);
  check(fields.marker == std::string("since"), "marker kept verbatim");
  check(fields.year == 1990, "year parsed");
  check(fields.is_temporal_record(), "marker makes a temporal record");
  check(!fields.date.has_value(), "no date for linked data");

  const auto empty_year = extract_line("A\trel\tB\tuntil\t ", DatasetType::LINKED_DATA);
  check(empty_year.marker == std::string("until"), "marker without year still counted");
  check(!empty_year.year.has_value(), "blank year token ignored");

  const auto bad_year = extract_line("A\trel\tB\tsince\t19x0", DatasetType::LINKED_DATA);
  check(bad_year.marker.has_value() && !bad_year.year.has_value(), "malformed year dropped, marker kept");

  check(extract_line("A\trel\tB\tsince", DatasetType::LINKED_DATA).empty(), "four columns carry nothing");

  check(TemporalExtractor::parse_year("-44") == -44, "negative year");
  check(TemporalExtractor::parse_year("+2001") == 2001, "explicit plus sign");
  check(!TemporalExtractor::parse_year("+-5").has_value(), "double sign rejected");
  check(!TemporalExtractor::parse_year("").has_value(), "empty year rejected");
}

void test_fact_extraction() {
  const auto fields = extract_line("A\trel\tB\t<occursSince>\t\"1995-01-01\"", DatasetType::FACT_EXTRACTION);
  check(fields.marker == std::string("occursSince"), "brackets stripped from marker");
  check(fields.year == 1995, "year from quoted date");
  check(!fields.date.has_value(), "no full date for fact extraction");

  const auto partial = extract_line("A\trel\tB\t<occursUntil>\t\"19##-##-##\"", DatasetType::FACT_EXTRACTION);
  check(partial.marker == std::string("occursUntil"), "marker kept for partial date");
  check(!partial.year.has_value(), "fewer than four leading digits gives no year");

  check(TemporalExtractor::leading_digits_year("201x") == std::nullopt, "three digits is too few");
  check(TemporalExtractor::leading_digits_year("20150-01") == 2015, "first four digits of a longer run");
  check(TemporalExtractor::strip_chars("<<x>>", "<>") == "x", "strip both ends");
  check(TemporalExtractor::strip_chars("\"\"", "\"").empty(), "strip everything");
}

void test_generic_is_noop() {
  check(extract_line("A\trel\tB\t2010-05-01\t1990", DatasetType::GENERIC).empty(), "generic extracts nothing");
  check(extract_line("A\trel\tB\t1990", DatasetType::GENERIC).empty(), "generic ignores digit columns");
}

} // namespace

int main() {
  test_classify_dataset();
  test_event_calendar_date();
  test_event_calendar_invalid_dates();
  test_linked_data();
  test_fact_extraction();
  test_generic_is_noop();
  std::cout << "tkgstats temporal extractor tests passed\n";
  return 0;
}
