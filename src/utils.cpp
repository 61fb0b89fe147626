#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_hex(std::string_view data){
    Sha256Stream digest;
    digest.update(data.data(), data.size());
    return digest.finish_hex();
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string random_token(std::size_t length){
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;
    std::string out;
    out.reserve(length);
    // reject bytes past the largest multiple of the alphabet size to keep the draw uniform
    constexpr unsigned kLimit = 256 - (256 % kAlphabetSize);
    while(out.size() < length){
        for(auto b : random_bytes(length - out.size())){
            if(b < kLimit) out.push_back(kAlphabet[b % kAlphabetSize]);
        }
    }
    return out;
}

void Sha256Stream::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1){
        throw std::runtime_error("SHA-256 initialisation failed");
    }
}

Sha256Stream::~Sha256Stream() = default;

void Sha256Stream::update(const char* data, std::size_t size){
    if(finished_) throw std::logic_error("Sha256Stream already finished");
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_.get(), data, size) != 1){
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256Stream::finish_hex(){
    if(finished_) throw std::logic_error("Sha256Stream already finished");
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1){
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    finished_ = true;
    out.resize(len);
    return hex_from_bytes(out);
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

bool iequals(std::string_view a, std::string_view b){
    if(a.size() != b.size()) return false;
    for(std::size_t i = 0; i < a.size(); ++i){
        if(std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))){
            return false;
        }
    }
    return true;
}
