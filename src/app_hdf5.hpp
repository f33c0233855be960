/**
 ==============================================================================
 Copyright 2019, Jonathan Zrake

 Permission is hereby granted, free of charge, to any person obtaining a copy of
 this software and associated documentation files (the "Software"), to deal in
 the Software without restriction, including without limitation the rights to
 use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 of the Software, and to permit persons to whom the Software is furnished to do
 so, subject to the following conditions:

 The above copyright notice and this permission notice shall be included in all
 copies or substantial portions of the Software.

 THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 SOFTWARE.

 ==============================================================================
*/




#pragma once
#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include <hdf5.h>




//=============================================================================
namespace h5 {

namespace detail {

inline herr_t first_error(unsigned n, const H5E_error2_t *err, void *data)
{
    if (n == 0)
    {
        *static_cast<H5E_error2_t*>(data) = *err;
    }
    return 0;
}

/**
 * Pass a non-negative HDF5 return value through, or throw
 * std::invalid_argument with the description of the innermost error on the
 * HDF5 error stack.
 */
inline hid_t check(hid_t result)
{
    if (result < 0)
    {
        auto err = H5E_error2_t();
        auto eid = H5Eget_current_stack();
        H5Ewalk(eid, H5E_WALK_UPWARD, first_error, &err);
        auto what = std::string(err.desc ? err.desc : "unknown HDF5 error");
        H5Eclear(eid);
        H5Eclose_stack(eid);
        throw std::invalid_argument("h5 (" + what + ")");
    }
    return result;
}

} // namespace detail




/**
 * @brief      Owns an HDF5 identifier, and closes it with the function that
 *             matches its kind. Identifiers can be moved but not copied.
 */
class Identifier
{
public:

    /**
     * @brief      The kinds of HDF5 object an identifier can refer to.
     */
    enum class Type
    {
        Dataset,
        Dataspace,
        Datatype,
        File,
        Group,
    };

    Identifier() {}
    Identifier(const Identifier& other) = delete;
    Identifier(Identifier&& other) : id(other.id)
    {
        other.id.reset();
    }
    ~Identifier() { close(); }

    /**
     * @brief      Move-assignment operator for an identifier. The identifier
     *             previously held by this one is closed.
     *
     * @param      other  The identifier to be moved from
     *
     * @return     This identifier after the assignment
     */
    Identifier& operator=(Identifier&& other)
    {
        close();
        id = other.id;
        other.id.reset();
        return *this;
    }

    /**
     * @brief      Close this identifier, decrementing its reference count
     *             within the HDF5 library. Closing a closed identifier does
     *             nothing.
     */
    void close()
    {
        if (! id.has_value())
            return;

        switch (id->second)
        {
            case Type::Dataset:    H5Dclose(id->first); break;
            case Type::Dataspace:  H5Sclose(id->first); break;
            case Type::Datatype:   H5Tclose(id->first); break;
            case Type::File:       H5Fclose(id->first); break;
            case Type::Group:      H5Gclose(id->first); break;
        }
        id.reset();
    }

    /**
     * @brief      Determine whether this identifier is open.
     *
     * @return     True if open, False otherwise.
     */
    bool is_open() const
    {
        return id.has_value();
    }

private:

    /**
     * @brief      Get the untyped HDF5 identifier, if this is open. Otherwise
     *             throws an error.
     *
     * @return     The HDF5 id.
     */
    operator hid_t() const
    {
        if (! is_open())
        {
            throw std::invalid_argument("h5::Identifier (id is not open)");
        }
        return id->first;
    }

    friend class Dataset;
    friend class Dataspace;
    friend class Datatype;
    friend class File;
    friend class Group;

    Identifier(hid_t id, Type type) : id(std::pair(detail::check(id), type)) {}
    static Identifier dataset  (hid_t id) { return Identifier(id, Type::Dataset); }
    static Identifier dataspace(hid_t id) { return Identifier(id, Type::Dataspace); }
    static Identifier datatype (hid_t id) { return Identifier(id, Type::Datatype); }
    static Identifier file     (hid_t id) { return Identifier(id, Type::File); }
    static Identifier group    (hid_t id) { return Identifier(id, Type::Group); }

    std::optional<std::pair<hid_t, Type>> id;
};




//=============================================================================
class Dataspace
{
public:

    /**
     * @brief      Return a new scalar dataspace
     *
     * @return     A new dataspace
     */
    static Dataspace scalar()
    {
        return Identifier::dataspace(H5Screate(H5S_SCALAR));
    }

    /**
     * @brief      A fixed-size one-dimensional dataspace. HDF5 does not allow
     *             zero-sized simple dataspaces to be read back reliably on all
     *             versions, so empty containers get a null dataspace.
     */
    static Dataspace linear(std::size_t size)
    {
        if (size == 0)
        {
            return Identifier::dataspace(H5Screate(H5S_NULL));
        }
        auto dims = hsize_t(size);
        return Identifier::dataspace(H5Screate_simple(1, &dims, nullptr));
    }

    Dataspace() {}
    Dataspace(Identifier&& id) : id(std::move(id)) {}

    bool operator==(const Dataspace& other) const { return   detail::check(H5Sextent_equal(id, other.id)); }
    bool operator!=(const Dataspace& other) const { return ! detail::check(H5Sextent_equal(id, other.id)); }

    /**
     * @brief      Return the number of points in this dataspace
     *
     * @return     The number of points
     */
    std::size_t size() const
    {
        return detail::check(H5Sget_simple_extent_npoints(id));
    }

private:
    friend class Dataset;
    friend class Group;
    Identifier id;
};




//=============================================================================
/**
 * @brief      An HDF5 datatype. Types are always copies of the predefined
 *             ones, so they can be modified and are closed when destroyed.
 */
class Datatype
{
public:
    static Datatype native_char()   { return Identifier::datatype(H5Tcopy(H5T_NATIVE_CHAR)); }
    static Datatype native_double() { return Identifier::datatype(H5Tcopy(H5T_NATIVE_DOUBLE)); }
    static Datatype native_int()    { return Identifier::datatype(H5Tcopy(H5T_NATIVE_INT)); }
    static Datatype native_long()   { return Identifier::datatype(H5Tcopy(H5T_NATIVE_LONG)); }
    static Datatype native_ulong()  { return Identifier::datatype(H5Tcopy(H5T_NATIVE_ULONG)); }
    static Datatype c_s1()          { return Identifier::datatype(H5Tcopy(H5T_C_S1)); }

    Datatype() {}
    Datatype(Identifier&& id) : id(std::move(id)) {}

    bool operator==(const Datatype& other) const { return   detail::check(H5Tequal(id, other.id)); }
    bool operator!=(const Datatype& other) const { return ! detail::check(H5Tequal(id, other.id)); }

    /**
     * @brief      Return the size of one element of this type, in bytes.
     */
    std::size_t size() const
    {
        return detail::check(H5Tget_size(id));
    }

    /**
     * @brief      Return a copy of this type with a different element size.
     *             This is how fixed-length string types are made.
     *
     * @param[in]  size  The new size in bytes
     *
     * @return     A new datatype
     */
    Datatype with_size(std::size_t size) const
    {
        auto result = Datatype(Identifier::datatype(H5Tcopy(id)));
        detail::check(H5Tset_size(result.id, size));
        return result;
    }

private:
    friend class Dataset;
    friend class Group;
    Identifier id;
};




//=============================================================================
class Dataset
{
public:
    Dataset() {}
    Dataset(Identifier&& id) : id(std::move(id)) {}

    Dataspace get_space() const
    {
        return Identifier::dataspace(H5Dget_space(id));
    }

    Datatype get_type() const
    {
        return Identifier::datatype(H5Dget_type(id));
    }

    /**
     * @brief      Write the whole dataset from a buffer. The buffer is laid
     *             out as described by the given type and space.
     *
     * @param[in]  type   The memory type of the buffer
     * @param[in]  space  The memory space of the buffer
     * @param[in]  data   The buffer to write from
     */
    void write(const Datatype& type, const Dataspace& space, const void* data) const
    {
        detail::check(H5Dwrite(id, type.id, space.id, space.id, H5P_DEFAULT, data));
    }

    void read(const Datatype& type, const Dataspace& space, void* data) const
    {
        detail::check(H5Dread(id, type.id, space.id, space.id, H5P_DEFAULT, data));
    }

private:
    Identifier id;
};




//=============================================================================
class Group
{
public:
    Group() {}
    Group(Identifier&& id) : id(std::move(id)) {}

    /**
     * @brief      Return true if this group has a subgroup with the given name
     *
     * @param[in]  name  The name of the group
     *
     * @return     True or false
     */
    bool contains_group(std::string name) const
    {
        return link_type(name) == H5O_TYPE_GROUP;
    }

    /**
     * @brief      Return true if this group has a dataset with the given name
     *
     * @param[in]  name  The name of the dataset
     *
     * @return     True or false
     */
    bool contains_dataset(std::string name) const
    {
        return link_type(name) == H5O_TYPE_DATASET;
    }

    /**
     * @brief      Create a group with the given name. Throws an exception if
     *             the group already exists.
     *
     * @param[in]  name  The group name to create
     *
     * @return     The group
     */
    Group create_group(std::string name) const
    {
        return Identifier::group(H5Gcreate(id, name.data(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT));
    }

    /**
     * @brief      Open a group with the given name. Throws an exception if the
     *             group does not exist.
     *
     * @param[in]  name  The group name to open
     *
     * @return     The group
     */
    Group open_group(std::string name) const
    {
        return Identifier::group(H5Gopen(id, name.data(), H5P_DEFAULT));
    }

    /**
     * @brief      Open or create a group with the given name.
     *
     * @param[in]  name  The group name to open or create
     *
     * @return     The group
     */
    Group require_group(std::string name) const
    {
        return contains_group(name) ? open_group(name) : create_group(name);
    }

    /**
     * @brief      Opens a dataset that already exists.
     *
     * @param[in]  name  The name of the dataset
     *
     * @return     A dataset
     */
    Dataset open_dataset(std::string name) const
    {
        return Identifier::dataset(H5Dopen(id, name.data(), H5P_DEFAULT));
    }

    /**
     * @brief      Create a dataset, replacing any existing link of the same
     *             name.
     */
    Dataset replace_dataset(std::string name, const Datatype& type, const Dataspace& space) const
    {
        if (detail::check(H5Lexists(id, name.data(), H5P_DEFAULT)))
        {
            detail::check(H5Ldelete(id, name.data(), H5P_DEFAULT));
        }
        return Identifier::dataset(H5Dcreate(id, name.data(), type.id, space.id, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT));
    }

    /**
     * @brief      The names of the links in this group, in increasing order.
     */
    std::vector<std::string> names() const
    {
        auto info = H5G_info_t();
        auto result = std::vector<std::string>();

        detail::check(H5Gget_info(id, &info));

        for (hsize_t n = 0; n < info.nlinks; ++n)
        {
            auto size = detail::check(H5Lget_name_by_idx(id, ".", H5_INDEX_NAME, H5_ITER_INC, n, nullptr, 0, H5P_DEFAULT));
            auto name = std::string(size + 1, '\0');
            detail::check(H5Lget_name_by_idx(id, ".", H5_INDEX_NAME, H5_ITER_INC, n, name.data(), name.size(), H5P_DEFAULT));
            name.resize(size);
            result.push_back(name);
        }
        return result;
    }

private:
    std::optional<H5O_type_t> link_type(const std::string& name) const
    {
        if (! detail::check(H5Lexists(id, name.data(), H5P_DEFAULT)))
        {
            return {};
        }
        auto info = H5O_info_t();
#if H5_VERSION_GE(1, 12, 0)
        detail::check(H5Oget_info_by_name(id, name.data(), &info, H5O_INFO_BASIC, H5P_DEFAULT));
#else
        detail::check(H5Oget_info_by_name(id, name.data(), &info, H5P_DEFAULT));
#endif
        return info.type;
    }

    Identifier id;
};




//=============================================================================
class File
{
public:
    enum class Access
    {
        Read,
        ReadWrite,
        Truncate,
    };

    /**
     * @brief      Translate a mode string ("r", "r+", or "w") to an access
     *             mode.
     */
    static Access access(std::string mode)
    {
        if (mode == "r")  return Access::Read;
        if (mode == "r+") return Access::ReadWrite;
        if (mode == "w")  return Access::Truncate;

        throw std::invalid_argument("h5::File (no such access mode " + mode + ")");
    }

    File() {}
    File(std::string filename, std::string mode) : File(filename, access(mode)) {}
    File(std::string filename, Access access=Access::Read)
    {
        switch (access)
        {
            case Access::Read:      id = Identifier::file(H5Fopen  (filename.data(), H5F_ACC_RDONLY, H5P_DEFAULT)); break;
            case Access::ReadWrite: id = Identifier::file(H5Fopen  (filename.data(), H5F_ACC_RDWR,   H5P_DEFAULT)); break;
            case Access::Truncate:  id = Identifier::file(H5Fcreate(filename.data(), H5F_ACC_TRUNC,  H5P_DEFAULT, H5P_DEFAULT)); break;
        }
    }

    void close()
    {
        id = {};
    }

    operator Group() const
    {
        return Identifier::group(H5Gopen(id, "/", H5P_DEFAULT));
    }

private:
    Identifier id;
};

} // namespace h5




//=============================================================================
namespace h5 {




/**
 * Customization points describing how a C++ type is laid out in a dataset:
 * its element datatype, its dataspace, the address of its data, and how to
 * allocate a container able to receive a dataset's contents. Key-value
 * containers are written as groups, one link per key.
 */
template<typename T>
struct hdf5_datatype_creation
{
};

template<typename T>
struct hdf5_dataspace_creation
{
    Dataspace operator()(const T&) const { return Dataspace::scalar(); }
};

template<typename T>
struct hdf5_container_address
{
    const void* operator()(const T& value) const { return &value; }
    void* operator()(T& value) const { return &value; }
};

template<typename T>
struct hdf5_container_creation
{
    T operator()(const Dataset&) const { return T(); }
};

template<typename T>
struct hdf5_is_key_value_container : std::false_type
{
};

template<typename T, typename = void>
struct hdf5_is_writable : std::false_type
{
};

template<typename T>
struct hdf5_is_writable<T, std::void_t<decltype(hdf5_datatype_creation<T>()(std::declval<const T&>()))>> : std::true_type
{
};




//=============================================================================
template<typename T>
Datatype make_datatype_for(const T& value)
{
    return hdf5_datatype_creation<T>()(value);
}

template<typename T>
Dataspace make_dataspace_for(const T& value)
{
    return hdf5_dataspace_creation<T>()(value);
}




//=============================================================================
template<> struct hdf5_datatype_creation<char>          { Datatype operator()(const char&)          const { return Datatype::native_char(); } };
template<> struct hdf5_datatype_creation<double>        { Datatype operator()(const double&)        const { return Datatype::native_double(); } };
template<> struct hdf5_datatype_creation<int>           { Datatype operator()(const int&)           const { return Datatype::native_int(); } };
template<> struct hdf5_datatype_creation<long>          { Datatype operator()(const long&)          const { return Datatype::native_long(); } };
template<> struct hdf5_datatype_creation<unsigned long> { Datatype operator()(const unsigned long&) const { return Datatype::native_ulong(); } };




//=============================================================================
template<>
struct hdf5_datatype_creation<std::string>
{
    Datatype operator()(const std::string& value) const
    {
        return Datatype::c_s1().with_size(std::max(std::size_t(1), value.size()));
    }
};

template<>
struct hdf5_container_address<std::string>
{
    const void* operator()(const std::string& value) const { return value.data(); }
    void* operator()(std::string& value) const { return value.data(); }
};

template<>
struct hdf5_container_creation<std::string>
{
    std::string operator()(const Dataset& dset) const
    {
        return std::string(dset.get_type().size(), '\0');
    }
};




//=============================================================================
template<typename T>
struct hdf5_datatype_creation<std::vector<T>>
{
    Datatype operator()(const std::vector<T>&) const { return make_datatype_for(T()); }
};

template<typename T>
struct hdf5_dataspace_creation<std::vector<T>>
{
    Dataspace operator()(const std::vector<T>& value) const { return Dataspace::linear(value.size()); }
};

template<typename T>
struct hdf5_container_address<std::vector<T>>
{
    const void* operator()(const std::vector<T>& value) const { return value.data(); }
    void* operator()(std::vector<T>& value) const { return value.data(); }
};

template<typename T>
struct hdf5_container_creation<std::vector<T>>
{
    std::vector<T> operator()(const Dataset& dset) const
    {
        return std::vector<T>(dset.get_space().size());
    }
};

template<typename T>
struct hdf5_is_key_value_container<std::map<std::string, T>> : std::true_type
{
};




//=============================================================================
template<typename T>
void write(const Group& group, std::string name, const T& value)
{
    if constexpr (hdf5_is_key_value_container<T>::value)
    {
        auto subgroup = group.require_group(name);

        for (const auto& item : value)
        {
            write(subgroup, item.first, item.second);
        }
    }
    else
    {
        auto type = make_datatype_for(value);
        auto space = make_dataspace_for(value);
        auto dset = group.replace_dataset(name, type, space);

        if (space.size() > 0)
        {
            dset.write(type, space, hdf5_container_address<T>()(value));
        }
    }
}

template<typename T>
T read(const Group& group, std::string name)
{
    auto value = T();

    if constexpr (hdf5_is_key_value_container<T>::value)
    {
        auto subgroup = group.open_group(name);

        for (auto key : subgroup.names())
        {
            value[key] = read<typename T::mapped_type>(subgroup, key);
        }
    }
    else
    {
        auto dset = group.open_dataset(name);
        auto space = dset.get_space();
        value = hdf5_container_creation<T>()(dset);

        if (space.size() > 0)
        {
            dset.read(make_datatype_for(value), space, hdf5_container_address<T>()(value));
        }
        if constexpr (std::is_same_v<T, std::string>)
        {
            // the empty string is stored as a single NUL
            value.erase(value.find_last_not_of('\0') + 1);
        }
    }
    return value;
}

} // namespace h5




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <cstdio>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_hdf5()
{
    auto filename = std::string("lazyseq_test_hdf5.h5");

    auto round_trips = [filename] (auto value)
    {
        {
            auto file = h5::File(filename, h5::File::Access::Truncate);
            h5::write(file, "value", value);
        }
        auto file = h5::File(filename, h5::File::Access::Read);
        return h5::read<decltype(value)>(file, "value") == value;
    };

    require(round_trips(10));
    require(round_trips(10ul));
    require(round_trips(2.5));
    require(round_trips(std::string("ten")));
    require(round_trips(std::string()));
    require(round_trips(std::vector{1l, 2l, 3l}));
    require(round_trips(std::vector<double>{}));
    require(round_trips(std::vector{'a', 'b'}));
    require(round_trips(std::map<std::string, std::vector<int>>{{"odd", {1, 3}}, {"even", {2}}}));

    {
        auto file = h5::File(filename, "w");
        auto root = h5::Group(file);
        root.create_group("group");
        h5::write(root, "data", 1);
        h5::write(root, "data", std::string("rewritten"));

        require(  root.contains_group("group"));
        require(! root.contains_group("data"));
        require(  root.contains_dataset("data"));
        require(! root.contains_dataset("absent"));
        require((root.names() == std::vector<std::string>{"data", "group"}));
        require(h5::read<std::string>(root, "data") == "rewritten");
        require_throws(root.open_group("absent"));
    }
    require_throws(h5::File("lazyseq_no_such_file.h5", "r"));
    require_throws(h5::File(filename, "a"));
    std::remove(filename.data());
}

#endif // DO_UNIT_TESTS
