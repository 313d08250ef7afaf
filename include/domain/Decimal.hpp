#pragma once

#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>

namespace bullion::domain {

/**
 * @brief Десятичное число с фиксированной точкой (8 знаков после запятой)
 *
 * Используется для денег (THB), цен и количества золота.
 * Хранится как целое число (raw = value × 10^8),
 * поэтому сложение и вычитание точные, а строковое представление
 * переживает запись в NUMERIC(20,8) и JSON без потерь.
 *
 * Умножение и деление округляют результат до 8 знаков (half away from zero).
 *
 * Пример: 2000.50 THB = {raw: 200050000000}
 */
class Decimal {
public:
    static constexpr int SCALE_DIGITS = 8;
    static constexpr int64_t SCALE = 100000000;

    Decimal() = default;

    static Decimal fromRaw(int64_t raw) {
        Decimal d;
        d.raw_ = raw;
        return d;
    }

    static Decimal fromInt(int64_t units) {
        return fromRaw(units * SCALE);
    }

    /**
     * @brief Создать из double (округление до 8 знаков)
     */
    static Decimal fromDouble(double value) {
        return fromRaw(static_cast<int64_t>(std::llround(value * static_cast<double>(SCALE))));
    }

    /**
     * @brief Разобрать строку вида "-1234.5678"
     * @throws std::invalid_argument если строка не является числом
     *         или содержит больше 8 знаков после запятой
     */
    static Decimal fromString(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Empty decimal string");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = text[pos] == '-';
            ++pos;
        }

        int64_t units = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDigit = false;
        bool seenPoint = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seenPoint) {
                    throw std::invalid_argument("Invalid decimal: " + text);
                }
                seenPoint = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid decimal: " + text);
            }
            seenDigit = true;
            if (seenPoint) {
                if (fractionDigits == SCALE_DIGITS) {
                    throw std::invalid_argument("Too many fractional digits: " + text);
                }
                fraction = fraction * 10 + (c - '0');
                ++fractionDigits;
            } else {
                if (units > (INT64_MAX / SCALE) / 10 + 1) {
                    throw std::invalid_argument("Decimal out of range: " + text);
                }
                units = units * 10 + (c - '0');
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid decimal: " + text);
        }

        for (int i = fractionDigits; i < SCALE_DIGITS; ++i) {
            fraction *= 10;
        }

        if (units > (INT64_MAX - fraction) / SCALE) {
            throw std::invalid_argument("Decimal out of range: " + text);
        }
        int64_t raw = units * SCALE + fraction;
        return fromRaw(negative ? -raw : raw);
    }

    int64_t raw() const { return raw_; }

    double toDouble() const {
        return static_cast<double>(raw_) / static_cast<double>(SCALE);
    }

    /**
     * @brief Точное строковое представление
     *
     * Незначащие нули дробной части отбрасываются, но остаётся минимум
     * два знака: "500.00", "0.27777778", "-12.50".
     */
    std::string toString() const {
        int64_t absRaw = raw_ < 0 ? -raw_ : raw_;
        std::string fraction = std::to_string(absRaw % SCALE);
        fraction.insert(0, SCALE_DIGITS - fraction.size(), '0');
        while (fraction.size() > 2 && fraction.back() == '0') {
            fraction.pop_back();
        }

        std::string result = raw_ < 0 ? "-" : "";
        result += std::to_string(absRaw / SCALE);
        result += ".";
        result += fraction;
        return result;
    }

    /**
     * @brief Округлить до заданного числа знаков (half away from zero)
     */
    Decimal rounded(int digits) const {
        if (digits >= SCALE_DIGITS) {
            return *this;
        }
        int64_t step = 1;
        for (int i = digits; i < SCALE_DIGITS; ++i) {
            step *= 10;
        }
        int64_t absRaw = raw_ < 0 ? -raw_ : raw_;
        int64_t roundedAbs = ((absRaw + step / 2) / step) * step;
        return fromRaw(raw_ < 0 ? -roundedAbs : roundedAbs);
    }

    /**
     * @brief Сколько значащих знаков после запятой
     */
    int fractionDigits() const {
        int64_t fraction = (raw_ < 0 ? -raw_ : raw_) % SCALE;
        if (fraction == 0) {
            return 0;
        }
        int digits = SCALE_DIGITS;
        while (fraction % 10 == 0) {
            fraction /= 10;
            --digits;
        }
        return digits;
    }

    Decimal operator+(const Decimal& other) const { return fromRaw(raw_ + other.raw_); }
    Decimal operator-(const Decimal& other) const { return fromRaw(raw_ - other.raw_); }
    Decimal operator-() const { return fromRaw(-raw_); }

    Decimal& operator+=(const Decimal& other) {
        raw_ += other.raw_;
        return *this;
    }

    Decimal& operator-=(const Decimal& other) {
        raw_ -= other.raw_;
        return *this;
    }

    /**
     * @brief Умножение (цена × количество)
     */
    Decimal operator*(const Decimal& other) const {
        long double product = static_cast<long double>(raw_) * static_cast<long double>(other.raw_)
                            / static_cast<long double>(SCALE);
        return fromRaw(static_cast<int64_t>(std::llroundl(product)));
    }

    /**
     * @brief Деление (сумма / цена)
     * @throws std::domain_error при делении на ноль
     */
    Decimal operator/(const Decimal& other) const {
        if (other.raw_ == 0) {
            throw std::domain_error("Decimal division by zero");
        }
        long double quotient = static_cast<long double>(raw_) * static_cast<long double>(SCALE)
                             / static_cast<long double>(other.raw_);
        return fromRaw(static_cast<int64_t>(std::llroundl(quotient)));
    }

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

    bool isZero() const { return raw_ == 0; }
    bool isNegative() const { return raw_ < 0; }
    bool isPositive() const { return raw_ > 0; }

    Decimal abs() const { return fromRaw(raw_ < 0 ? -raw_ : raw_); }

private:
    int64_t raw_ = 0;
};

/// Денежные суммы в THB хранятся с точностью до сатанга
constexpr int CURRENCY_DIGITS = 2;

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace bullion::domain
