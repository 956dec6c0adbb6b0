#pragma once
#include <yyjson.h>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "errors.hpp"

namespace QueryFusion {

// Default Array<> sub-codec: the elements as one JSON array, e.g. ["1","2"] or [1,2].
class JsonArrayCodec {
public:
    // codes below 100 are yyjson_read_code / yyjson_write_code values
    enum class Error : int {
        NotAnArray = 100,
        ElementTypeMismatch,
        NumberOutOfRange,
        AllocFailed
    };

    template<class T>
    static constexpr bool supports_element =
        std::is_same_v<T, bool> ||
        std::is_same_v<T, float> ||
        std::is_same_v<T, double> ||
        std::is_same_v<T, std::string> ||
        (std::is_integral_v<T> && !std::is_same_v<T, char> && sizeof(T) <= 8);

    template<class T>
        requires supports_element<T>
    static bool encode(const std::vector<T> & items, std::string & out, ArrayCodecError & err) {
        MutDocPtr doc(yyjson_mut_doc_new(nullptr));
        if (!doc) {
            return fail(err, Error::AllocFailed, "yyjson document allocation failed");
        }
        yyjson_mut_val* arr = yyjson_mut_arr(doc.get());
        if (!arr) {
            return fail(err, Error::AllocFailed, "yyjson array allocation failed");
        }
        yyjson_mut_doc_set_root(doc.get(), arr);

        for (const T & item : items) {
            yyjson_mut_val* v = makeValue(doc.get(), item);
            if (!v || !yyjson_mut_arr_add_val(arr, v)) {
                return fail(err, Error::AllocFailed, "yyjson value allocation failed");
            }
        }

        yyjson_write_err werr;
        std::size_t len = 0;
        char* json = yyjson_mut_write_opts(doc.get(), YYJSON_WRITE_NOFLAG, nullptr, &len, &werr);
        if (!json) {
            err = ArrayCodecError{int(werr.code), werr.msg ? std::string_view(werr.msg) : std::string_view{}, 0};
            return false;
        }
        out.append(json, len);
        std::free(json);
        return true;
    }

    template<class T>
        requires supports_element<T>
    static bool decode(std::string_view text, std::vector<T> & items, ArrayCodecError & err) {
        items.clear();
        yyjson_read_err rerr;
        // without YYJSON_READ_INSITU the input buffer is only read
        DocPtr doc(yyjson_read_opts(const_cast<char*>(text.data()), text.size(), YYJSON_READ_NOFLAG, nullptr, &rerr));
        if (!doc) {
            err = ArrayCodecError{int(rerr.code), rerr.msg ? std::string_view(rerr.msg) : std::string_view{}, rerr.pos};
            return false;
        }
        yyjson_val* root = yyjson_doc_get_root(doc.get());
        if (!yyjson_is_arr(root)) {
            return fail(err, Error::NotAnArray, "JSON document is not an array");
        }
        items.reserve(yyjson_arr_size(root));

        std::size_t idx, max;
        yyjson_val* v;
        yyjson_arr_foreach(root, idx, max, v) {
            T item{};
            if (!readValue(v, item, err)) {
                err.pos = idx;
                items.clear();
                return false;
            }
            items.push_back(std::move(item));
        }
        return true;
    }

private:
    struct DocFree {
        void operator()(yyjson_doc* d) const { yyjson_doc_free(d); }
    };
    struct MutDocFree {
        void operator()(yyjson_mut_doc* d) const { yyjson_mut_doc_free(d); }
    };
    using DocPtr = std::unique_ptr<yyjson_doc, DocFree>;
    using MutDocPtr = std::unique_ptr<yyjson_mut_doc, MutDocFree>;

    static bool fail(ArrayCodecError & err, Error e, std::string_view msg) {
        err = ArrayCodecError{int(e), msg, 0};
        return false;
    }

    template<class T>
    static yyjson_mut_val* makeValue(yyjson_mut_doc* doc, const T & value) {
        if constexpr (std::is_same_v<T, bool>) {
            return yyjson_mut_bool(doc, value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return yyjson_mut_strncpy(doc, value.data(), value.size());
        } else if constexpr (std::is_floating_point_v<T>) {
            return yyjson_mut_real(doc, static_cast<double>(value));
        } else if constexpr (std::is_signed_v<T>) {
            return yyjson_mut_sint(doc, static_cast<int64_t>(value));
        } else {
            return yyjson_mut_uint(doc, static_cast<uint64_t>(value));
        }
    }

    template<class T>
    static bool readValue(yyjson_val* v, T & storage, ArrayCodecError & err) {
        if constexpr (std::is_same_v<T, bool>) {
            if (!yyjson_is_bool(v)) {
                return fail(err, Error::ElementTypeMismatch, "expected a JSON boolean");
            }
            storage = yyjson_get_bool(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (!yyjson_is_str(v)) {
                return fail(err, Error::ElementTypeMismatch, "expected a JSON string");
            }
            storage.assign(yyjson_get_str(v), yyjson_get_len(v));
        } else if constexpr (std::is_floating_point_v<T>) {
            if (!yyjson_is_num(v)) {
                return fail(err, Error::ElementTypeMismatch, "expected a JSON number");
            }
            double d = yyjson_get_num(v);
            if (d < double(std::numeric_limits<T>::lowest()) ||
                d > double(std::numeric_limits<T>::max())) {
                return fail(err, Error::NumberOutOfRange, "number out of range for element type");
            }
            storage = static_cast<T>(d);
        } else {
            if (yyjson_is_sint(v)) {
                auto i = yyjson_get_sint(v);
                if constexpr (std::is_unsigned_v<T>) {
                    if (i < 0 || std::uint64_t(i) > std::uint64_t(std::numeric_limits<T>::max())) {
                        return fail(err, Error::NumberOutOfRange, "number out of range for element type");
                    }
                } else {
                    if (i < std::int64_t(std::numeric_limits<T>::lowest()) ||
                        i > std::int64_t(std::numeric_limits<T>::max())) {
                        return fail(err, Error::NumberOutOfRange, "number out of range for element type");
                    }
                }
                storage = static_cast<T>(i);
            } else if (yyjson_is_uint(v)) {
                auto u = yyjson_get_uint(v);
                if (u > std::uint64_t(std::numeric_limits<T>::max())) {
                    return fail(err, Error::NumberOutOfRange, "number out of range for element type");
                }
                storage = static_cast<T>(u);
            } else {
                return fail(err, Error::ElementTypeMismatch, "expected a JSON integer");
            }
        }
        return true;
    }
};

} // namespace QueryFusion
