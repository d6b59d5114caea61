#include "case_functions.hpp"
#include "case_transform.hpp"
#include "utils.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/vector_operations/ternary_executor.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace changecase {

// DuckDB scalar function wrappers
template <CaseConverter CONVERT>
static void ChangecaseConvertFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string output = CONVERT(input.GetString(), SplitOptions());
            return StringVector::AddString(result, output);
        });
}

template <CaseConverter CONVERT>
static void ChangecaseConvertSplitFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, bool, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t input, bool split_numbers) {
            std::string output = CONVERT(input.GetString(), SplitOptions(split_numbers));
            return StringVector::AddString(result, output);
        });
}

static void ChangecaseTitleCaseFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string output = to_title_case(input.GetString());
            return StringVector::AddString(result, output);
        });
}

static void ChangecaseSwapCaseFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string output = to_swap_case(input.GetString());
            return StringVector::AddString(result, output);
        });
}

static void ChangecaseUpperCaseFirstFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string output = upper_case_first(input.GetString());
            return StringVector::AddString(result, output);
        });
}

static void ChangecaseLowerCaseFirstFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string output = lower_case_first(input.GetString());
            return StringVector::AddString(result, output);
        });
}

static void ChangecaseSplitWordsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto count = args.size();
    bool has_split_arg = args.ColumnCount() > 1;

    UnifiedVectorFormat input_data;
    args.data[0].ToUnifiedFormat(count, input_data);
    auto input_strings = UnifiedVectorFormat::GetData<string_t>(input_data);

    UnifiedVectorFormat split_data;
    if (has_split_arg) {
        args.data[1].ToUnifiedFormat(count, split_data);
    }

    result.SetVectorType(VectorType::FLAT_VECTOR);
    auto list_entries = FlatVector::GetData<list_entry_t>(result);
    auto &result_validity = FlatVector::Validity(result);
    idx_t current_list_offset = ListVector::GetListSize(result);

    for (idx_t i = 0; i < count; i++) {
        auto idx = input_data.sel->get_index(i);
        if (!input_data.validity.RowIsValid(idx)) {
            result_validity.SetInvalid(i);
            continue;
        }

        SplitOptions options;
        if (has_split_arg) {
            auto split_idx = split_data.sel->get_index(i);
            if (!split_data.validity.RowIsValid(split_idx)) {
                result_validity.SetInvalid(i);
                continue;
            }
            options.split_numbers = UnifiedVectorFormat::GetData<bool>(split_data)[split_idx];
        }

        auto words = split_words(input_strings[idx].GetString(), options);
        list_entries[i].offset = current_list_offset;
        list_entries[i].length = words.size();
        for (const auto &word : words) {
            ListVector::PushBack(result, Value(word));
        }
        current_list_offset += words.size();
    }
}

static const CaseConvention &LookupConvention(const string_t &name) {
    auto convention = find_case_convention(name.GetString());
    if (!convention) {
        throw InvalidInputException("changecase_convert: unknown convention '%s', expected one of: %s",
                                    name.GetString(), case_convention_names());
    }
    return *convention;
}

static void ChangecaseConvertByNameFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t input, string_t name) {
            auto &convention = LookupConvention(name);
            std::string output = convention.convert(input.GetString(), SplitOptions());
            return StringVector::AddString(result, output);
        });
}

static void ChangecaseConvertByNameSplitFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    TernaryExecutor::Execute<string_t, string_t, bool, string_t>(
        args.data[0], args.data[1], args.data[2], result, args.size(),
        [&](string_t input, string_t name, bool split_numbers) {
            auto &convention = LookupConvention(name);
            std::string output = convention.convert(input.GetString(), SplitOptions(split_numbers));
            return StringVector::AddString(result, output);
        });
}

static WordCase ParseWordCase(const string_t &name) {
    WordCase word_case;
    if (!try_parse_word_case(name.GetString(), word_case)) {
        throw InvalidInputException(
            "changecase_change_case: unknown word case '%s', expected one of: lower, upper, capital, preserve",
            name.GetString());
    }
    return word_case;
}

static void ChangecaseChangeCaseFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    TernaryExecutor::Execute<string_t, string_t, string_t, string_t>(
        args.data[0], args.data[1], args.data[2], result, args.size(),
        [&](string_t input, string_t delimiter, string_t word_case) {
            auto parsed = ParseWordCase(word_case);
            CaseOptions options(delimiter.GetString(), parsed, parsed);
            return StringVector::AddString(result, change_case(input.GetString(), options));
        });
}

// changecase_change_case(input, delimiter, first_word_case, other_words_case)
static void ChangecaseChangeCaseFirstWordFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto count = args.size();

    UnifiedVectorFormat formats[4];
    for (idx_t col = 0; col < 4; col++) {
        args.data[col].ToUnifiedFormat(count, formats[col]);
    }

    result.SetVectorType(VectorType::FLAT_VECTOR);
    auto result_strings = FlatVector::GetData<string_t>(result);
    auto &result_validity = FlatVector::Validity(result);

    for (idx_t i = 0; i < count; i++) {
        string_t values[4];
        bool is_valid = true;
        for (idx_t col = 0; col < 4; col++) {
            auto idx = formats[col].sel->get_index(i);
            if (!formats[col].validity.RowIsValid(idx)) {
                is_valid = false;
                break;
            }
            values[col] = UnifiedVectorFormat::GetData<string_t>(formats[col])[idx];
        }
        if (!is_valid) {
            result_validity.SetInvalid(i);
            continue;
        }

        CaseOptions options(values[1].GetString(), ParseWordCase(values[2]), ParseWordCase(values[3]));
        result_strings[i] = StringVector::AddString(result, change_case(values[0].GetString(), options));
    }
}

template <CaseConverter CONVERT>
static void RegisterConverter(ExtensionLoader &loader, const std::string &name, const std::string &description) {
    ScalarFunctionSet function_set(name);

    auto func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, ChangecaseConvertFunction<CONVERT>);
    func.description = description;
    function_set.AddFunction(func);

    auto split_func = ScalarFunction({LogicalType::VARCHAR, LogicalType::BOOLEAN}, LogicalType::VARCHAR,
                                     ChangecaseConvertSplitFunction<CONVERT>);
    split_func.description = description + "\nOptional second argument: split_numbers (BOOLEAN, default true)";
    function_set.AddFunction(split_func);

    loader.RegisterFunction(function_set);
}

void RegisterCaseTransformFunctions(ExtensionLoader &loader) {
    RegisterConverter<to_camel_case>(loader, "changecase_to_camel_case",
                                     "Converts a string to camelCase (first word lowercase, following words capitalized, no separators).\n"
                                     "Usage: SELECT changecase_to_camel_case('Test String');\n"
                                     "Returns: VARCHAR (e.g., 'testString')");
    RegisterConverter<to_pascal_case>(loader, "changecase_to_pascal_case",
                                      "Converts a string to PascalCase (all words capitalized, no separators).\n"
                                      "Usage: SELECT changecase_to_pascal_case('test string');\n"
                                      "Returns: VARCHAR (e.g., 'TestString')");
    RegisterConverter<to_capital_case>(loader, "changecase_to_capital_case",
                                       "Converts a string to Capital Case (all words capitalized, separated by spaces).\n"
                                       "Usage: SELECT changecase_to_capital_case('test_string');\n"
                                       "Returns: VARCHAR (e.g., 'Test String')");
    RegisterConverter<to_snake_case>(loader, "changecase_to_snake_case",
                                     "Converts a string to snake_case (lowercase words separated by underscores).\n"
                                     "Usage: SELECT changecase_to_snake_case('TestString');\n"
                                     "Returns: VARCHAR (e.g., 'test_string')");
    RegisterConverter<to_param_case>(loader, "changecase_to_param_case",
                                     "Converts a string to param-case (lowercase words separated by hyphens).\n"
                                     "Usage: SELECT changecase_to_param_case('TestString');\n"
                                     "Returns: VARCHAR (e.g., 'test-string')");
    RegisterConverter<to_param_case>(loader, "changecase_to_kebab_case",
                                     "Alias of changecase_to_param_case.\n"
                                     "Usage: SELECT changecase_to_kebab_case('TestString');\n"
                                     "Returns: VARCHAR (e.g., 'test-string')");
    RegisterConverter<to_constant_case>(loader, "changecase_to_constant_case",
                                        "Converts a string to CONSTANT_CASE (uppercase words separated by underscores).\n"
                                        "Usage: SELECT changecase_to_constant_case('testString');\n"
                                        "Returns: VARCHAR (e.g., 'TEST_STRING')");
    RegisterConverter<to_dot_case>(loader, "changecase_to_dot_case",
                                   "Converts a string to dot.case (lowercase words separated by dots).\n"
                                   "Usage: SELECT changecase_to_dot_case('TestString');\n"
                                   "Returns: VARCHAR (e.g., 'test.string')");
    RegisterConverter<to_path_case>(loader, "changecase_to_path_case",
                                    "Converts a string to path/case (lowercase words separated by slashes).\n"
                                    "Usage: SELECT changecase_to_path_case('TestString');\n"
                                    "Returns: VARCHAR (e.g., 'test/string')");
    RegisterConverter<to_header_case>(loader, "changecase_to_header_case",
                                      "Converts a string to Header-Case (capitalized words separated by hyphens).\n"
                                      "Usage: SELECT changecase_to_header_case('test_string');\n"
                                      "Returns: VARCHAR (e.g., 'Test-String')");
    RegisterConverter<to_sentence_case>(loader, "changecase_to_sentence_case",
                                        "Converts a string to Sentence case (first word capitalized, rest lowercase, separated by spaces).\n"
                                        "Usage: SELECT changecase_to_sentence_case('TEST_STRING');\n"
                                        "Returns: VARCHAR (e.g., 'Test string')");

    auto title_case_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, ChangecaseTitleCaseFunction);
    title_case_func.description = "Converts a string to Title Case, keeping small words, acronyms and URLs as written.\n"
                                  "Usage: SELECT changecase_to_title_case('this vs that');\n"
                                  "Returns: VARCHAR (e.g., 'This vs That')";
    ScalarFunctionSet title_case_set("changecase_to_title_case");
    title_case_set.AddFunction(title_case_func);
    loader.RegisterFunction(title_case_set);

    auto swap_case_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, ChangecaseSwapCaseFunction);
    swap_case_func.description = "Inverts the case of every letter, leaving everything else untouched.\n"
                                 "Usage: SELECT changecase_to_swap_case('Test String');\n"
                                 "Returns: VARCHAR (e.g., 'tEST sTRING')";
    ScalarFunctionSet swap_case_set("changecase_to_swap_case");
    swap_case_set.AddFunction(swap_case_func);
    loader.RegisterFunction(swap_case_set);

    auto upper_first_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                           ChangecaseUpperCaseFirstFunction);
    upper_first_func.description = "Uppercases the first character of a string.\n"
                                   "Usage: SELECT changecase_upper_case_first('test');\n"
                                   "Returns: VARCHAR (e.g., 'Test')";
    ScalarFunctionSet upper_first_set("changecase_upper_case_first");
    upper_first_set.AddFunction(upper_first_func);
    loader.RegisterFunction(upper_first_set);

    auto lower_first_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                           ChangecaseLowerCaseFirstFunction);
    lower_first_func.description = "Lowercases the first character of a string.\n"
                                   "Usage: SELECT changecase_lower_case_first('TEST');\n"
                                   "Returns: VARCHAR (e.g., 'tEST')";
    ScalarFunctionSet lower_first_set("changecase_lower_case_first");
    lower_first_set.AddFunction(lower_first_func);
    loader.RegisterFunction(lower_first_set);

    // changecase_split_words
    ScalarFunctionSet split_words_set("changecase_split_words");
    auto split_words_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::LIST(LogicalType::VARCHAR),
                                           ChangecaseSplitWordsFunction);
    split_words_func.description = "Splits a string into words on separators, case changes and digits.\n"
                                   "Usage: SELECT changecase_split_words('XMLHttpRequest');\n"
                                   "Returns: VARCHAR[] (e.g., ['XML', 'Http', 'Request'])";
    split_words_set.AddFunction(split_words_func);
    split_words_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::BOOLEAN},
                                               LogicalType::LIST(LogicalType::VARCHAR), ChangecaseSplitWordsFunction));
    loader.RegisterFunction(split_words_set);

    // changecase_convert
    ScalarFunctionSet convert_set("changecase_convert");
    auto convert_func = ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                       ChangecaseConvertByNameFunction);
    convert_func.description = "Converts a string to the named convention (" + case_convention_names() + ").\n"
                               "Usage: SELECT changecase_convert('Test String', 'snake_case');\n"
                               "Returns: VARCHAR (e.g., 'test_string')";
    convert_set.AddFunction(convert_func);
    convert_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::BOOLEAN},
                                           LogicalType::VARCHAR, ChangecaseConvertByNameSplitFunction));
    loader.RegisterFunction(convert_set);

    // changecase_change_case
    ScalarFunctionSet change_case_set("changecase_change_case");
    auto change_case_func = ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR},
                                           LogicalType::VARCHAR, ChangecaseChangeCaseFunction);
    change_case_func.description = "Splits a string into words, applies a word case (lower, upper, capital, preserve) "
                                   "and joins them with the given delimiter.\n"
                                   "Usage: SELECT changecase_change_case('TestString', ' :: ', 'upper');\n"
                                   "Returns: VARCHAR (e.g., 'TEST :: STRING')";
    change_case_set.AddFunction(change_case_func);
    change_case_set.AddFunction(ScalarFunction(
        {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR},
        LogicalType::VARCHAR, ChangecaseChangeCaseFirstWordFunction));
    loader.RegisterFunction(change_case_set);
}

} // namespace changecase
} // namespace duckdb
