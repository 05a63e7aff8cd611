#include "NameNormalizer.h"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

namespace poi
{
    namespace
    {
        // Letters that NFD leaves intact, already lowercased
        const char *fallbackLetter(UChar32 c)
        {
            switch (c)
            {
            case 0x0111: // đ
            case 0x00F0: // ð
                return "d";
            case 0x0142: // ł
                return "l";
            case 0x00F8: // ø
                return "o";
            case 0x00E6: // æ
                return "ae";
            case 0x0153: // œ
                return "oe";
            case 0x00DF: // ß
                return "ss";
            case 0x00FE: // þ
                return "th";
            case 0x0131: // ı
                return "i";
            default:
                return nullptr;
            }
        }

        // Lowercased ASCII letters, digits, spaces and parentheses
        std::string foldToAscii(const std::string &text)
        {
            UErrorCode status = U_ZERO_ERROR;
            const icu::Normalizer2 *nfd = icu::Normalizer2::getNFDInstance(status);
            if (U_FAILURE(status))
            {
                throw std::runtime_error(std::string("NameNormalizer: ICU NFD unavailable: ") + u_errorName(status));
            }

            icu::UnicodeString source = icu::UnicodeString::fromUTF8(text);
            source.toLower(icu::Locale::getRoot());
            icu::UnicodeString decomposed = nfd->normalize(source, status);
            if (U_FAILURE(status))
            {
                throw std::runtime_error(std::string("NameNormalizer: NFD failed: ") + u_errorName(status));
            }

            std::string folded;
            folded.reserve(text.size());
            for (int32_t i = 0; i < decomposed.length();)
            {
                UChar32 c = decomposed.char32At(i);
                i += U16_LENGTH(c);

                if (c < 0x80)
                {
                    char ch = static_cast<char>(c);
                    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '(' || ch == ')')
                    {
                        folded.push_back(ch);
                    }
                    else if (u_isUWhiteSpace(c))
                    {
                        folded.push_back(' ');
                    }
                    continue;
                }

                if (u_charType(c) == U_NON_SPACING_MARK)
                {
                    continue;
                }
                if (const char *mapped = fallbackLetter(c))
                {
                    folded += mapped;
                }
                else if (u_isUWhiteSpace(c))
                {
                    folded.push_back(' ');
                }
            }
            return folded;
        }

        std::string stripParenthesized(const std::string &text)
        {
            std::string out;
            out.reserve(text.size());
            for (size_t i = 0; i < text.size(); ++i)
            {
                if (text[i] == '(')
                {
                    size_t close = text.find(')', i + 1);
                    if (close != std::string::npos)
                    {
                        i = close;
                    }
                    continue;
                }
                if (text[i] == ')')
                {
                    continue;
                }
                out.push_back(text[i]);
            }
            return out;
        }

        std::string collapseSpaces(const std::string &text)
        {
            std::string out;
            out.reserve(text.size());
            bool pending_space = false;
            for (char ch : text)
            {
                if (ch == ' ')
                {
                    pending_space = !out.empty();
                    continue;
                }
                if (pending_space)
                {
                    out.push_back(' ');
                    pending_space = false;
                }
                out.push_back(ch);
            }
            return out;
        }
    } // namespace

    std::string normalizeName(const std::string &text)
    {
        if (text.empty())
        {
            return text;
        }
        return collapseSpaces(stripParenthesized(foldToAscii(text)));
    }

    std::string compactName(const std::string &text)
    {
        std::string normalized = normalizeName(text);
        std::string compact;
        compact.reserve(normalized.size());
        for (char ch : normalized)
        {
            if (ch != ' ')
            {
                compact.push_back(ch);
            }
        }
        return compact;
    }

    double nameSimilarity(const std::string &a, const std::string &b)
    {
        if (a == b)
        {
            return 1.0;
        }
        const size_t total = a.size() + b.size();
        if (total == 0)
        {
            return 1.0;
        }

        // Longest common subsequence, two rolling rows
        std::vector<size_t> prev(b.size() + 1, 0);
        std::vector<size_t> curr(b.size() + 1, 0);
        for (size_t i = 1; i <= a.size(); ++i)
        {
            for (size_t j = 1; j <= b.size(); ++j)
            {
                if (a[i - 1] == b[j - 1])
                {
                    curr[j] = prev[j - 1] + 1;
                }
                else
                {
                    curr[j] = std::max(prev[j], curr[j - 1]);
                }
            }
            std::swap(prev, curr);
        }
        return 2.0 * static_cast<double>(prev[b.size()]) / static_cast<double>(total);
    }

} // namespace poi
