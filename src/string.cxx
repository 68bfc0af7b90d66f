#include <util.hxx>

#include <cctype>

std::istream &GetLine(std::istream &stream, std::string &string, const std::string_view &delim)
{
    string.clear();

    int c;
    while (string.find(delim) == std::string::npos && (c = stream.get()) != std::char_traits<char>::eof())
        string += static_cast<char>(c);

    if (string.find(delim) == std::string::npos)
        return stream;

    string = string.substr(0, string.size() - delim.size());
    return stream;
}

std::string Trim(std::string string)
{
    auto begin = string.find_first_not_of(" \t\r\n\v\f");
    if (begin == std::string::npos)
        return {};

    auto end = string.find_last_not_of(" \t\r\n\v\f");
    return string.substr(begin, end - begin + 1);
}

std::string Lower(std::string string)
{
    for (auto &it : string)
        it = static_cast<char>(std::tolower(static_cast<unsigned char>(it)));
    return string;
}

std::vector<std::string> Split(std::string_view string, const char delim)
{
    std::vector<std::string> segments;

    std::size_t beg = 0, end;
    while ((end = string.find(delim, beg)) != std::string_view::npos)
    {
        segments.emplace_back(string.substr(beg, end - beg));
        beg = end + 1;
    }
    segments.emplace_back(string.substr(beg));

    return segments;
}
