#include <digest.hxx>

#include <fstream>
#include <iostream>
#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

static void PrintError(const char *what)
{
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    std::cerr << what << ": " << buf << std::endl;
}

static std::string ToHex(const unsigned char *data, const unsigned len)
{
    static constexpr char digits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned i = 0; i < len; ++i)
    {
        hex += digits[data[i] >> 4];
        hex += digits[data[i] & 0xF];
    }
    return hex;
}

static int Finish(EVP_MD_CTX *ctx, std::string &hex)
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned len = 0;

    if (!EVP_DigestFinal_ex(ctx, md, &len))
    {
        PrintError("failed to finish digest");
        return 1;
    }

    hex = ToHex(md, len);
    return 0;
}

std::string digest::Sha256(std::string_view data)
{
    DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || !EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
    {
        PrintError("failed to initialize digest");
        return {};
    }

    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size()))
    {
        PrintError("failed to update digest");
        return {};
    }

    std::string hex;
    if (Finish(ctx.get(), hex))
        return {};
    return hex;
}

int digest::Sha256File(const std::filesystem::path &path, std::string &hex)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream)
    {
        std::cerr << "failed to open " << path.string() << " for reading." << std::endl;
        return 1;
    }

    DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || !EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
    {
        PrintError("failed to initialize digest");
        return 1;
    }

    char buf[0x4000];
    while (stream)
    {
        stream.read(buf, sizeof(buf));
        const auto len = stream.gcount();
        if (len <= 0)
            break;

        if (!EVP_DigestUpdate(ctx.get(), buf, static_cast<std::size_t>(len)))
        {
            PrintError("failed to update digest");
            return 1;
        }
    }

    if (stream.bad())
    {
        std::cerr << "failed to read " << path.string() << "." << std::endl;
        return 1;
    }

    return Finish(ctx.get(), hex);
}
