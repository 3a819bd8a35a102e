#include "puzzle_parser.hpp"
#include "parser.hpp"
#include <cstdio>
#include <stdexcept>

// flex が生成する関数（lexer.cpp）
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

namespace tango_logic {
namespace puzzle {

namespace {

struct FileCloser {
    void operator()(FILE* file) const { std::fclose(file); }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

/**
 * @brief 再入可能スキャナと文字列バッファの所有者
 *
 * パーサーのアクションが例外を投げても、デストラクタでスキャナを解放する。
 */
class Scanner {
public:
    Scanner() {
        if (yylex_init(&scanner_) != 0) {
            throw std::runtime_error("Cannot initialize scanner");
        }
    }

    ~Scanner() {
        if (buffer_) {
            yy_delete_buffer(buffer_, scanner_);
        }
        yylex_destroy(scanner_);
    }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /**
     * @pre file は Scanner より長く生存する
     */
    void read_file(FILE* file) { yyset_in(file, scanner_); }

    void read_string(const std::string& input) {
        buffer_ = yy_scan_string(input.c_str(), scanner_);
    }

    /**
     * @brief 入力全体を構文解析し、記録した宣言を返す
     */
    std::unique_ptr<Model> parse() {
        ParserContext ctx;
        int result = yyparse(scanner_, &ctx);
        if (result != 0 || ctx.has_error) {
            throw std::runtime_error("Parse error: " + ctx.error_message);
        }
        return std::move(ctx.model);
    }

private:
    yyscan_t scanner_ = nullptr;
    YY_BUFFER_STATE buffer_ = nullptr;
};

} // namespace

std::unique_ptr<Model> parse_file(const std::string& filename) {
    FilePtr file(std::fopen(filename.c_str(), "r"));
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    Scanner scanner;
    scanner.read_file(file.get());
    return scanner.parse();
}

std::unique_ptr<Model> parse_string(const std::string& input) {
    Scanner scanner;
    scanner.read_string(input);
    return scanner.parse();
}

} // namespace puzzle
} // namespace tango_logic
