#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "decode_result.hpp"
#include "field_map.hpp"
#include "scalar_codec.hpp"
#include "array.hpp"

namespace QueryFusion {

namespace decoder_details {


class DecodingContext {
    FieldMap m_fields;
    Error m_error{};

public:
    FieldMap & fields() {
        return m_fields;
    }

    bool withError(ErrorCode code, std::string_view key, Cause cause = {}) {
        m_error = Error{.code = code, .key = key, .cause = cause};
        return false;
    }

    bool withLiteralError(std::string_view key, std::string_view literalType, Cause cause) {
        m_error = Error{.code = ErrorCode::INVALID_LITERAL, .key = key, .literal_type = literalType, .cause = cause};
        return false;
    }

    DecodeResult result() const {
        return DecodeResult(m_error);
    }
};


template<class FieldOpts>
constexpr bool isNotRequired = FieldOpts::template has_option<options::detail::not_required_tag>;

template<class Record>
bool anyFlatKeyPresent(const FieldMap & fields) {
    for(std::string_view k : struct_fields_helper::FieldsHelper<Record>::flatKeys) {
        if(fields.contains(k)) {
            return true;
        }
    }
    return false;
}


// One raw value into a scalar, or into a transformer whose wire type is a scalar.
template <class T>
bool DecodeText(std::string_view key, std::string_view text, T & obj, DecodingContext & ctx) {
    if constexpr (static_schema::QueryScalar<T>) {
        Cause cause{};
        if(!scalar_codec::DecodeScalar(text, obj, cause)) {
            return ctx.withLiteralError(key, static_schema::scalar_type_name<T>(), cause);
        }
        return true;
    } else {
        using W = typename T::wire_type;
        using Meta = options::detail::annotation_meta_getter<W>;
        W wire{};
        if(!DecodeText(key, text, Meta::getRef(wire), ctx)) {
            return false;
        }
        if(!obj.transform_from(wire)) {
            return ctx.withError(ErrorCode::TRANSFORMER_ERROR, key);
        }
        return true;
    }
}


template <class FieldOpts, class Field>
bool DecodeField(std::string_view key, Field & obj, DecodingContext & ctx);


template <class ObjT, std::size_t StructIndex>
bool DecodeOneRecordField(ObjT & structObj, DecodingContext & ctx) {
    using FieldOpts = options::detail::aggregate_field_opts_getter<ObjT, StructIndex>;
    if constexpr (FieldOpts::template has_option<options::detail::exclude_tag>) {
        return true;
    } else {
        using Field = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
        using Meta  = options::detail::annotation_meta_getter<Field>;
        constexpr std::string_view key = struct_fields_helper::FieldsHelper<ObjT>::template fieldName<StructIndex>();
        return DecodeField<FieldOpts>(key,
                                      Meta::getRef(introspection::getStructElementByIndex<StructIndex>(structObj)),
                                      ctx);
    }
}

template <class ObjT, std::size_t... StructIndex>
bool DecodeRecordFields(ObjT & structObj, DecodingContext & ctx, std::index_sequence<StructIndex...>) {
    return (DecodeOneRecordField<ObjT, StructIndex>(structObj, ctx) && ...);
}

template <class ObjT>
    requires static_schema::QueryRecord<ObjT>
bool DecodeRecord(ObjT & obj, DecodingContext & ctx) {
    static_assert(struct_fields_helper::FieldsHelper<ObjT>::keysAreUnique,
                  "[[[ QueryFusion ]]] two fields of this record (nested records included) share a wire key");
    return DecodeRecordFields(obj, ctx, std::make_index_sequence<introspection::structureElementsCount<ObjT>>{});
}


template <class FieldOpts, class Field>
bool DecodeField(std::string_view key, Field & obj, DecodingContext & ctx) {
    FieldMap & fields = ctx.fields();

    if constexpr (static_schema::QueryScalar<Field>) {
        auto text = fields.takeFirst(key);
        if(!text) {
            return isNotRequired<FieldOpts> ? true : ctx.withError(ErrorCode::NO_VALUE, key);
        }
        return DecodeText(key, *text, obj, ctx);
    } else if constexpr (static_schema::QueryTransformer<Field>) {
        using W = typename Field::wire_type;
        using Meta = options::detail::annotation_meta_getter<W>;
        if(!fields.contains(key)) {
            if(isNotRequired<FieldOpts>) {
                return true;
            }
            // an absent required sequence is the empty wire value
            if constexpr (!static_schema::QuerySequence<W>) {
                return ctx.withError(ErrorCode::NO_VALUE, key);
            }
        }
        W wire{};
        if(!DecodeField<FieldOpts>(key, Meta::getRef(wire), ctx)) {
            return false;
        }
        if(!obj.transform_from(wire)) {
            return ctx.withError(ErrorCode::TRANSFORMER_ERROR, key);
        }
        return true;
    } else if constexpr (static_schema::QueryOptional<Field>) {
        using Inner = typename Field::value_type;
        using Meta = options::detail::annotation_meta_getter<Inner>;
        bool present;
        if constexpr (static_schema::QueryRecord<Inner>) {
            present = anyFlatKeyPresent<static_schema::AnnotatedValue<Inner>>(fields);
        } else {
            present = fields.contains(key);
        }
        if(!present) {
            obj.reset();
            return true;
        }
        Inner inner{};
        if(!DecodeField<FieldOpts>(key, Meta::getRef(inner), ctx)) {
            return false;
        }
        obj = std::move(inner);
        return true;
    } else if constexpr (static_schema::QueryArray<Field>) {
        using Codec = typename Field::query_array_codec;
        auto text = fields.takeFirst(key);
        if(!text) {
            return isNotRequired<FieldOpts> ? true : ctx.withError(ErrorCode::NO_VALUE, key);
        }
        ArrayCodecError err{};
        if(!Codec::decode(*text, obj.values, err)) {
            return ctx.withError(ErrorCode::ARRAY_CODEC_ERROR, key, Cause::from_array_codec(err));
        }
        return true;
    } else if constexpr (static_schema::QuerySequence<Field>) {
        using Elem = typename Field::value_type;
        using Meta = options::detail::annotation_meta_getter<Elem>;
        if(isNotRequired<FieldOpts> && !fields.contains(key)) {
            return true;
        }
        obj.clear();
        for(std::string_view text : fields.takeAll(key)) {
            Elem item{};
            if(!DecodeText(key, text, Meta::getRef(item), ctx)) {
                return false;
            }
            obj.push_back(std::move(item));
        }
        return true;
    } else if constexpr (static_schema::QueryRecord<Field>) {
        return DecodeRecord(obj, ctx);
    } else {
        static_assert(static_schema::detail::always_false<Field>::value,
                      "[[[ QueryFusion ]]] field type is not a QueryFieldValue");
        return false;
    }
}

} // namespace decoder_details


// Fills obj from a key=value&... text. obj is assigned only when the whole
// text decodes; on failure it keeps its previous value. Error keys may view
// into text.
template <static_schema::QueryRootValue InputObjectT>
DecodeResult Decode(InputObjectT & obj, std::string_view text) {
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;
    using ValueT = typename Meta::value_t;

    decoder_details::DecodingContext ctx;
    if(DecodeResult r = FieldMap::Parse(text, ctx.fields()); !r) {
        return r;
    }
    ValueT tmp{};
    if(!decoder_details::DecodeRecord(tmp, ctx)) {
        return ctx.result();
    }
    Meta::getRef(obj) = std::move(tmp);
    return ctx.result();
}


template <class T>
    requires (!static_schema::QueryRootValue<T>)
DecodeResult Decode(T &, std::string_view) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ QueryFusion ]]] T is not a supported QueryFusion root type.\n"
                  "see QueryRootValue concept for full rules");
    return {};
}

} // namespace QueryFusion
