#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "decode_result.hpp"
#include "scalar_codec.hpp"
#include "array.hpp"

namespace QueryFusion {

namespace encoder_details {


class EncodingContext {
    std::string & m_out;
    bool m_first = true;
    Error m_error{};

public:
    explicit EncodingContext(std::string & out): m_out(out) {}

    // Commits "&key=" (no '&' before the first pair); the caller appends the value.
    std::string & beginPair(std::string_view key) {
        if(!m_first) {
            m_out.push_back('&');
        }
        m_first = false;
        m_out += key;
        m_out.push_back('=');
        return m_out;
    }

    bool withError(ErrorCode code, std::string_view key, Cause cause = {}) {
        m_error = Error{.code = code, .key = key, .cause = cause};
        return false;
    }

    EncodeResult result() const {
        return EncodeResult(m_error);
    }
};


template<class FieldOpts>
consteval int floatDecimals() {
    if constexpr (FieldOpts::template has_option<options::detail::float_decimals_tag>) {
        using decimals = typename FieldOpts::template get_option<options::detail::float_decimals_tag>;
        return int(decimals::value);
    } else {
        return -1;
    }
}


template <class FieldOpts, class Field>
bool EncodeField(std::string_view key, const Field & obj, EncodingContext & ctx);


template <class ObjT, std::size_t StructIndex>
bool EncodeOneRecordField(const ObjT & structObj, EncodingContext & ctx) {
    using FieldOpts = options::detail::aggregate_field_opts_getter<ObjT, StructIndex>;
    if constexpr (FieldOpts::template has_option<options::detail::exclude_tag>) {
        return true;
    } else {
        using Field = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
        using Meta  = options::detail::annotation_meta_getter<Field>;
        constexpr std::string_view key = struct_fields_helper::FieldsHelper<ObjT>::template fieldName<StructIndex>();
        return EncodeField<FieldOpts>(key,
                                      Meta::getRef(introspection::getStructElementByIndex<StructIndex>(structObj)),
                                      ctx);
    }
}

template <class ObjT, std::size_t... StructIndex>
bool EncodeRecordFields(const ObjT & structObj, EncodingContext & ctx, std::index_sequence<StructIndex...>) {
    return (EncodeOneRecordField<ObjT, StructIndex>(structObj, ctx) && ...);
}

template <class ObjT>
    requires static_schema::QueryRecord<ObjT>
bool EncodeRecord(const ObjT & obj, EncodingContext & ctx) {
    static_assert(struct_fields_helper::FieldsHelper<ObjT>::keysAreUnique,
                  "[[[ QueryFusion ]]] two fields of this record (nested records included) share a wire key");
    return EncodeRecordFields(obj, ctx, std::make_index_sequence<introspection::structureElementsCount<ObjT>>{});
}


template <class FieldOpts, class Field>
bool EncodeField(std::string_view key, const Field & obj, EncodingContext & ctx) {
    if constexpr (static_schema::QueryScalar<Field>) {
        scalar_codec::EncodeScalar<floatDecimals<FieldOpts>()>(obj, ctx.beginPair(key));
        return true;
    } else if constexpr (static_schema::QueryTransformer<Field>) {
        using W = typename Field::wire_type;
        using Meta = options::detail::annotation_meta_getter<W>;
        W wire{};
        if(!obj.transform_to(wire)) {
            return ctx.withError(ErrorCode::TRANSFORMER_ERROR, key);
        }
        return EncodeField<FieldOpts>(key, Meta::getRef(wire), ctx);
    } else if constexpr (static_schema::QueryOptional<Field>) {
        if(!obj.has_value()) {
            return true;
        }
        using Inner = typename Field::value_type;
        using Meta = options::detail::annotation_meta_getter<Inner>;
        return EncodeField<FieldOpts>(key, Meta::getRef(*obj), ctx);
    } else if constexpr (static_schema::QueryArray<Field>) {
        using Codec = typename Field::query_array_codec;
        std::string doc;
        ArrayCodecError err{};
        if(!Codec::encode(obj.values, doc, err)) {
            return ctx.withError(ErrorCode::ARRAY_CODEC_ERROR, key, Cause::from_array_codec(err));
        }
        ctx.beginPair(key) += doc;
        return true;
    } else if constexpr (static_schema::QuerySequence<Field>) {
        using Elem = typename Field::value_type;
        using Meta = options::detail::annotation_meta_getter<Elem>;
        for(const auto & item : obj) {
            if(!EncodeField<FieldOpts>(key, Meta::getRef(item), ctx)) {
                return false;
            }
        }
        return true;
    } else if constexpr (static_schema::QueryRecord<Field>) {
        // flattened: nested fields share the enclosing namespace
        return EncodeRecord(obj, ctx);
    } else {
        static_assert(static_schema::detail::always_false<Field>::value,
                      "[[[ QueryFusion ]]] field type is not a QueryFieldValue");
        return false;
    }
}

} // namespace encoder_details


// Replaces out with the key=value&... form of obj. On failure out holds the
// pairs committed before the failing field.
template <static_schema::QueryRootValue InputObjectT>
EncodeResult Encode(const InputObjectT & obj, std::string & out) {
    out.clear();
    encoder_details::EncodingContext ctx(out);
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;
    encoder_details::EncodeRecord(Meta::getRef(obj), ctx);
    return ctx.result();
}


template <class T>
    requires (!static_schema::QueryRootValue<T>)
EncodeResult Encode(const T &, std::string &) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ QueryFusion ]]] T is not a supported QueryFusion root type.\n"
                  "see QueryRootValue concept for full rules");
    return {};
}

} // namespace QueryFusion
