#include <lexgraph/parsing/page_source.h>

#include <spdlog/spdlog.h>

// QPDF headers
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <sstream>
#include <vector>

namespace lexgraph::parsing {

namespace {

// Collects text-showing operands; line-positioning operators start a new line so that
// headers at the start of a printed line stay at the start of an extracted line.
class PageTextCallback : public QPDFObjectHandle::ParserCallbacks {
public:
    explicit PageTextCallback(std::stringstream& t) : text_(t) {}

    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }
        const std::string op = obj.getOperatorValue();
        if (op == "Tj") {
            showStrings();
        } else if (op == "'" || op == "\"") {
            newLine();
            showStrings();
        } else if (op == "TJ") {
            showStrings();
        } else if (op == "Td" || op == "TD" || op == "T*" || op == "Tm" || op == "ET") {
            newLine();
        }
        operands_.clear();
    }

    void handleEOF() override { newLine(); }

private:
    void showStrings() {
        for (auto& operand : operands_) {
            if (operand.isString()) {
                append(operand.getUTF8Value());
            } else if (operand.isArray()) {
                for (auto& item : operand.getArrayAsVector()) {
                    if (item.isString()) {
                        append(item.getUTF8Value());
                    }
                }
            }
        }
    }

    void append(const std::string& s) {
        if (s.empty()) {
            return;
        }
        text_ << s;
        lineHasText_ = true;
    }

    void newLine() {
        if (lineHasText_) {
            text_ << '\n';
            lineHasText_ = false;
        }
    }

    std::stringstream& text_;
    std::vector<QPDFObjectHandle> operands_;
    bool lineHasText_ = false;
};

class QpdfPageSource : public IPageSource {
public:
    explicit QpdfPageSource(const std::filesystem::path& path) {
        pdf_.processFile(path.string().c_str());
        QPDFPageDocumentHelper dh(pdf_);
        pages_ = dh.getAllPages();
    }

    Result<std::size_t> pageCount() override { return pages_.size(); }

    Result<std::string> pageText(std::size_t index) override {
        if (index >= pages_.size()) {
            return Error{ErrorCode::InvalidArgument,
                         "Page index out of range: " + std::to_string(index)};
        }
        std::stringstream text;
        try {
            PageTextCallback callback(text);
            pages_[index].parsePageContents(&callback);
        } catch (const std::exception& e) {
            return Error{ErrorCode::InvalidData, "Failed to extract page " +
                                                     std::to_string(index + 1) + ": " + e.what()};
        }
        return text.str();
    }

private:
    QPDF pdf_;
    std::vector<QPDFPageObjectHelper> pages_;
};

} // namespace

Result<std::unique_ptr<IPageSource>> openQpdfPageSource(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::FileNotFound, "PDF file not found: " + path.string()};
    }
    try {
        return std::unique_ptr<IPageSource>(std::make_unique<QpdfPageSource>(path));
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, "Failed to load PDF: " + std::string(e.what())};
    }
}

} // namespace lexgraph::parsing
