#include "sqlsense/catalog/completion_vocabulary.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string_view>

namespace sqlsense::catalog {

namespace {

void append_all(std::set<std::string>& target, const std::vector<std::string>& source)
{
    target.insert(source.begin(), source.end());
}

}  // namespace

std::vector<std::string> merge_function_categories(const FunctionCategories& categories)
{
    std::set<std::string> merged;
    append_all(merged, categories.string_functions);
    append_all(merged, categories.numeric_functions);
    append_all(merged, categories.date_functions);
    append_all(merged, categories.conversion_functions);
    append_all(merged, categories.analytic_functions);
    append_all(merged, categories.miscellaneous_functions);
    return {merged.begin(), merged.end()};
}

ReservedWordSet derive_reserved_words(const std::vector<std::string>& keywords)
{
    ReservedWordSet words;
    for (const auto& keyword : keywords) {
        std::string_view view{keyword};
        std::size_t position = 0U;
        while (position < view.size()) {
            while (position < view.size() && std::isspace(static_cast<unsigned char>(view[position])) != 0) {
                ++position;
            }
            const auto start = position;
            while (position < view.size() && std::isspace(static_cast<unsigned char>(view[position])) == 0) {
                ++position;
            }
            if (position > start) {
                words.insert(uppercase_copy(view.substr(start, position - start)));
            }
        }
    }
    return words;
}

FunctionCategories make_default_function_categories()
{
    FunctionCategories categories;
    categories.string_functions = {"ASCII", "ASCIISTR", "CHR", "COMPOSE", "CONCAT", "CONVERT", "DECOMPOSE", "DUMP",
                                   "INITCAP", "INSTR", "INSTR2", "INSTR4", "INSTRB", "INSTRC", "LENGTH", "LENGTH2",
                                   "LENGTH4", "LENGTHB", "LENGTHC", "LOWER", "LPAD", "LTRIM", "NCHR", "REGEXP_INSTR",
                                   "REGEXP_REPLACE", "REGEXP_SUBSTR", "REPLACE", "RPAD", "RTRIM", "SOUNDEX", "SUBSTR",
                                   "TRANSLATE", "TRIM", "UPPER", "VSIZE"};
    categories.numeric_functions = {"ABS", "ACOS", "ASIN", "ATAN", "ATAN2", "AVG", "BITAND", "CEIL", "COS", "COSH",
                                    "COUNT", "EXP", "FLOOR", "GREATEST", "LEAST", "LN", "LOG", "MAX", "MEDIAN", "MIN",
                                    "MOD", "POWER", "REGEXP_COUNT", "REMAINDER", "ROUND", "ROWNUM", "SIGN", "SIN",
                                    "SINH", "SQRT", "SUM", "TAN", "TANH", "TRUNC"};
    categories.date_functions = {"ADD_MONTHS", "CURRENT_DATE", "CURRENT_TIMESTAMP", "DBTIMEZONE", "EXTRACT",
                                 "LAST_DAY", "LOCALTIMESTAMP", "MONTHS_BETWEEN", "NEW_TIME", "NEXT_DAY", "ROUND",
                                 "SESSIONTIMEZONE", "SYSDATE", "SYSTIMESTAMP", "TRUNC", "TZ_OFFSET"};
    categories.conversion_functions = {"BIN_TO_NUM", "CAST", "CHARTOROWID", "FROM_TZ", "HEXTORAW", "NUMTODSINTERVAL",
                                       "NUMTOYMINTERVAL", "RAWTOHEX", "TO_CHAR", "TO_CLOB", "TO_DATE",
                                       "TO_DSINTERVAL", "TO_LOB", "TO_MULTI_BYTE", "TO_NCLOB", "TO_NUMBER",
                                       "TO_SINGLE_BYTE", "TO_TIMESTAMP", "TO_TIMESTAMP_TZ", "TO_YMINTERVAL"};
    categories.analytic_functions = {"CORR", "COVAR_POP", "COVAR_SAMP", "CUME_DIST", "DENSE_RANK", "FIRST_VALUE",
                                     "LAG", "LAST_VALUE", "LEAD", "LISTAGG", "NTH_VALUE", "RANK", "STDDEV", "VAR_POP",
                                     "VAR_SAMP", "VARIANCE"};
    categories.miscellaneous_functions = {"BFILENAME", "CARDINALITY", "CASE", "COALESCE", "DECODE", "EMPTY_BLOB",
                                          "EMPTY_CLOB", "GROUP_ID", "LNNVL", "NANVL", "NULLIF", "NVL", "NVL2",
                                          "SYS_CONTEXT", "UID", "USER", "USERENV"};
    return categories;
}

std::vector<std::string> make_default_keywords()
{
    return {"ACCESS", "ADD", "ALL", "ALTER", "AND", "ANY", "AS", "ASC", "AUDIT", "BETWEEN", "BY", "CHAR", "CHECK",
            "CLUSTER", "COLUMN", "COMMENT", "COMMIT", "COMPRESS", "CONNECT", "CREATE", "CURRENT", "DATE", "DECIMAL",
            "DEFAULT", "DELETE", "DESC", "DESCRIBE", "DISTINCT", "DROP", "ELSE", "EXCLUSIVE", "EXISTS", "EXPLAIN PLAN",
            "FILE", "FLOAT", "FOR", "FROM", "FULL OUTER JOIN", "GRANT", "GROUP BY", "HAVING", "IDENTIFIED", "IMMEDIATE",
            "IN", "INCREMENT", "INDEX", "INITIAL", "INNER JOIN", "INSERT INTO", "INTEGER", "INTERSECT", "INTO", "IS",
            "JOIN", "LEFT OUTER JOIN", "LEVEL", "LIKE", "LOCK", "LONG", "MAXEXTENTS", "MERGE", "MINUS", "MODE",
            "MODIFY", "NOAUDIT", "NOCOMPRESS", "NOT", "NOWAIT", "NULL", "NUMBER", "OF", "OFFLINE", "ON", "ONLINE",
            "OPTION", "OR", "ORDER BY", "PCTFREE", "PRIOR", "PRIVILEGES", "PUBLIC", "RAW", "RENAME", "RESOURCE",
            "REVOKE", "RIGHT OUTER JOIN", "ROLLBACK", "ROW", "ROWID", "ROWS", "SAVEPOINT", "SELECT", "SESSION", "SET",
            "SHARE", "SIZE", "SMALLINT", "START", "SUCCESSFUL", "SYNONYM", "SYSDATE", "TABLE", "THEN", "TO", "TRIGGER",
            "TRUNCATE", "UNION", "UNIQUE", "UPDATE", "USE", "USING", "VALIDATE", "VALUES", "VARCHAR", "VARCHAR2",
            "VIEW", "WHENEVER", "WHERE", "WITH"};
}

CompletionVocabulary make_default_vocabulary()
{
    CompletionVocabulary vocabulary;
    vocabulary.keywords = make_default_keywords();
    vocabulary.functions = merge_function_categories(make_default_function_categories());
    vocabulary.special_commands = {"\\?", "\\T", "\\dt", "\\f", "\\fd", "\\fs", "\\refresh", "\\use", "\\dumb",
                                   "\\smart", "\\quit"};
    vocabulary.table_formats = {"ascii", "csv", "fancy_grid", "grid", "html", "latex", "mediawiki", "moinmoin",
                                "orgtbl", "pipe", "plain", "psql", "rst", "simple", "tsv", "vertical"};
    return vocabulary;
}

}  // namespace sqlsense::catalog
