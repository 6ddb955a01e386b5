#include "sheetbinder/core/Cell.hpp"

namespace sheetbinder {
namespace core {

namespace {
const std::string kEmptyString;
}

Cell::Cell(const std::string& value) {
    setValue<std::string>(value);
}

Cell::Cell(const char* value) {
    setValue<std::string>(std::string(value ? value : ""));
}

Cell::Cell(double value) {
    setValue<double>(value);
}

Cell::Cell(int value) {
    setValue<int>(value);
}

Cell::Cell(bool value) {
    setValue<bool>(value);
}

Cell& Cell::operator=(double value) {
    setValue<double>(value);
    return *this;
}

Cell& Cell::operator=(int value) {
    setValue<int>(value);
    return *this;
}

Cell& Cell::operator=(bool value) {
    setValue<bool>(value);
    return *this;
}

Cell& Cell::operator=(const std::string& value) {
    setValue<std::string>(value);
    return *this;
}

Cell& Cell::operator=(const char* value) {
    setValue<std::string>(std::string(value ? value : ""));
    return *this;
}

void Cell::resetValue() {
    type_ = CellType::Empty;
    number_ = 0.0;
    text_.clear();
    result_type_ = CellType::Empty;
    result_number_ = 0.0;
    result_text_.clear();
}

void Cell::clear() {
    resetValue();
    style_.reset();
}

// ========== 内部实现方法 ==========

void Cell::setValueImpl(double value) {
    resetValue();
    type_ = CellType::Number;
    number_ = value;
}

void Cell::setValueImpl(bool value) {
    resetValue();
    type_ = CellType::Boolean;
    number_ = value ? 1.0 : 0.0;
}

void Cell::setValueImpl(const std::string& value) {
    resetValue();
    type_ = CellType::String;
    text_ = value;
}

void Cell::setFormula(const std::string& formula) {
    resetValue();
    type_ = CellType::Formula;
    text_ = formula;
}

void Cell::setFormula(const std::string& formula, double result) {
    setFormula(formula);
    result_type_ = CellType::Number;
    result_number_ = result;
}

void Cell::setFormulaStringResult(const std::string& result) {
    if (type_ != CellType::Formula) return;
    result_type_ = CellType::String;
    result_number_ = 0.0;
    result_text_ = result;
}

void Cell::setFormulaBooleanResult(bool result) {
    if (type_ != CellType::Formula) return;
    result_type_ = CellType::Boolean;
    result_number_ = result ? 1.0 : 0.0;
    result_text_.clear();
}

void Cell::setFormulaErrorResult(const std::string& error) {
    if (type_ != CellType::Formula) return;
    result_type_ = CellType::Error;
    result_number_ = 0.0;
    result_text_ = error;
}

void Cell::setDate(double serial) {
    resetValue();
    type_ = CellType::Date;
    number_ = serial;
}

void Cell::setError(const std::string& error) {
    resetValue();
    type_ = CellType::Error;
    text_ = error;
}

void Cell::copyValueFrom(const Cell& other) {
    type_ = other.type_;
    number_ = other.number_;
    text_ = other.text_;
    result_type_ = other.result_type_;
    result_number_ = other.result_number_;
    result_text_ = other.result_text_;
}

// ========== 获取方法 ==========

const std::string& Cell::getStringValue() const {
    if (type_ == CellType::String || type_ == CellType::Error) {
        return text_;
    }
    return kEmptyString;
}

double Cell::getNumberValue() const {
    switch (type_) {
        case CellType::Number:
        case CellType::Date:
        case CellType::Boolean:
            return number_;
        case CellType::Formula:
            return result_number_;
        default:
            return 0.0;
    }
}

bool Cell::getBooleanValue() const {
    if (type_ == CellType::Boolean) {
        return number_ != 0.0;
    }
    if (type_ == CellType::Formula && result_type_ == CellType::Boolean) {
        return result_number_ != 0.0;
    }
    return false;
}

const std::string& Cell::getFormula() const {
    return type_ == CellType::Formula ? text_ : kEmptyString;
}

bool Cell::sameValueAs(const Cell& other) const {
    return type_ == other.type_ &&
           number_ == other.number_ &&
           text_ == other.text_ &&
           result_type_ == other.result_type_ &&
           result_number_ == other.result_number_ &&
           result_text_ == other.result_text_;
}

}} // namespace sheetbinder::core
