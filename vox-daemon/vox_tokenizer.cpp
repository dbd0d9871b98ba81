#include "vox_tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

using namespace std;

namespace {

const map<string, string>& contractionTable() {
    static const map<string, string> table = {
        {"aren't", "are not"},     {"can't", "can not"},       {"couldn't", "could not"},
        {"didn't", "did not"},     {"doesn't", "does not"},    {"don't", "do not"},
        {"hadn't", "had not"},     {"hasn't", "has not"},      {"haven't", "have not"},
        {"i'd", "i would"},        {"i'll", "i will"},         {"i'm", "i am"},
        {"i've", "i have"},        {"isn't", "is not"},        {"it's", "it is"},
        {"let's", "let us"},       {"shouldn't", "should not"}, {"that's", "that is"},
        {"there's", "there is"},   {"they'd", "they would"},   {"they'll", "they will"},
        {"they're", "they are"},   {"they've", "they have"},   {"wasn't", "was not"},
        {"we'd", "we would"},      {"we'll", "we will"},       {"we're", "we are"},
        {"we've", "we have"},      {"weren't", "were not"},    {"what's", "what is"},
        {"won't", "will not"},     {"wouldn't", "would not"},  {"you'd", "you would"},
        {"you'll", "you will"},    {"you're", "you are"},      {"you've", "you have"},
    };
    return table;
}

void replaceAll(string& s, const string& from, const string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool isAsciiAlnum(unsigned char c) { return c < 0x80 && isalnum(c); }

bool isPauseMark(const string& chunk, size_t i) {
    const char c = chunk[i];
    if (c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?') return true;
    if (c != '-') return false;
    // A hyphen between two alphanumerics belongs to the word ("x-ray").
    const bool prevAlnum = i > 0 && isAsciiAlnum(static_cast<unsigned char>(chunk[i - 1]));
    const bool nextAlnum = i + 1 < chunk.size() && isAsciiAlnum(static_cast<unsigned char>(chunk[i + 1]));
    return !(prevAlnum && nextAlnum);
}

string trimEdges(const string& piece) {
    size_t b = 0, e = piece.size();
    while (b < e && !isAsciiAlnum(static_cast<unsigned char>(piece[b])) && static_cast<unsigned char>(piece[b]) < 0x80) b++;
    while (e > b && !isAsciiAlnum(static_cast<unsigned char>(piece[e - 1])) && static_cast<unsigned char>(piece[e - 1]) < 0x80) e--;
    return piece.substr(b, e - b);
}

const char* kOnes[] = {"zero", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine",
                       "ten", "eleven", "twelve", "thirteen", "fourteen", "fifteen", "sixteen",
                       "seventeen", "eighteen", "nineteen"};
const char* kTens[] = {"", "", "twenty", "thirty", "forty", "fifty", "sixty", "seventy", "eighty", "ninety"};

void belowThousand(uint64_t n, vector<string>& out) {
    if (n >= 100) {
        out.emplace_back(kOnes[n / 100]);
        out.emplace_back("hundred");
        n %= 100;
        if (n == 0) return;
    }
    if (n >= 20) {
        out.emplace_back(kTens[n / 10]);
        if (n % 10) out.emplace_back(kOnes[n % 10]);
    } else {
        out.emplace_back(kOnes[n]);
    }
}

} // namespace

size_t VoxTokenization::wordCount() const {
    return static_cast<size_t>(count_if(tokens.begin(), tokens.end(), [](const VoxToken& t) { return t.isWord(); }));
}

vector<string> VoxTokenization::words() const {
    vector<string> out;
    for (const auto& t : tokens) {
        if (t.isWord()) out.push_back(t.word);
    }
    return out;
}

string VoxTokenizer::numberToWords(uint64_t n) {
    if (n == 0) return "zero";
    static const pair<uint64_t, const char*> scales[] = {
        {1000000000ULL, "billion"}, {1000000ULL, "million"}, {1000ULL, "thousand"}};
    vector<string> parts;
    for (const auto& [value, name] : scales) {
        if (n >= value) {
            belowThousand(n / value, parts);
            parts.emplace_back(name);
            n %= value;
        }
    }
    if (n > 0) belowThousand(n, parts);

    string joined;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) joined += ' ';
        joined += parts[i];
    }
    return joined;
}

int VoxTokenizer::pauseForMarks(const string& marks) const {
    if (marks.empty()) return 0;
    if (marks.find("...") != string::npos) return opts_.ellipsisPauseMs;
    if (marks.find_first_of(".!?") != string::npos) return opts_.periodPauseMs;
    if (marks.find_first_of(",;:") != string::npos) return opts_.commaPauseMs;
    if (marks.find('-') != string::npos) return opts_.dashPauseMs;
    return 0;
}

string VoxTokenizer::validateWord(const string& word) const {
    if (word.empty()) return "empty word";
    if (word.size() > opts_.maxWordLength) {
        return "exceeds maximum length of " + to_string(opts_.maxWordLength) + " characters";
    }
    if (!isAsciiAlnum(static_cast<unsigned char>(word.front()))) return "must start with a letter or digit";
    for (unsigned char c : word) {
        if (!(isAsciiAlnum(c) || c == '-' || c == '_')) return "contains unsupported characters";
    }
    return "";
}

void VoxTokenizer::emitWord(string word, size_t position, VoxTokenization& out) const {
    word = trimEdges(word);
    if (word.empty()) return;

    vector<string> expanded;
    if (word.find('\'') != string::npos) {
        auto it = contractionTable().find(word);
        if (opts_.contractions == VoxContractionMode::Expand && it != contractionTable().end()) {
            istringstream ss(it->second);
            string w;
            while (ss >> w) expanded.push_back(w);
        } else {
            word.erase(remove(word.begin(), word.end(), '\''), word.end());
            expanded.push_back(word);
        }
    } else {
        expanded.push_back(word);
    }

    for (auto& w : expanded) {
        const bool allDigits = !w.empty() && all_of(w.begin(), w.end(), [](unsigned char c) { return isdigit(c); });
        if (opts_.expandNumbers && allDigits && w.size() <= 9) {
            istringstream ss(numberToWords(stoull(w)));
            string part;
            while (ss >> part) out.tokens.push_back(VoxToken::makeWord(part, position));
            continue;
        }
        auto reason = validateWord(w);
        if (reason.empty()) {
            out.tokens.push_back(VoxToken::makeWord(w, position));
        } else {
            out.invalid.push_back(VoxInvalidWord{w, position, reason});
        }
    }
}

VoxTokenization VoxTokenizer::tokenize(const string& text) const {
    VoxTokenization out;

    string normalized = text;
    replaceAll(normalized, "\xE2\x80\xA6", "...");  // ellipsis
    replaceAll(normalized, "\xE2\x80\x94", " - ");  // em dash
    replaceAll(normalized, "\xE2\x80\x93", " - ");  // en dash
    replaceAll(normalized, "\xE2\x80\x99", "'");    // right single quote
    transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(tolower(c)) : static_cast<char>(c);
    });

    istringstream ss(normalized);
    string chunk;
    size_t position = 0;
    while (ss >> chunk) {
        string word, marks;
        auto flushMarks = [&]() {
            const int ms = pauseForMarks(marks);
            if (ms > 0) out.tokens.push_back(VoxToken::makePause(ms, position));
            marks.clear();
        };
        for (size_t i = 0; i < chunk.size(); i++) {
            if (isPauseMark(chunk, i)) {
                if (!word.empty()) {
                    emitWord(word, position, out);
                    word.clear();
                }
                marks += chunk[i];
            } else {
                if (!marks.empty()) flushMarks();
                word += chunk[i];
            }
        }
        if (!word.empty()) emitWord(word, position, out);
        if (!marks.empty()) flushMarks();
        position++;
    }
    return out;
}
