// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_PUBKEY_H
#define GOVCHAIN_PUBKEY_H

#include "serialize.h"
#include "uint256.h"

#include <stdexcept>
#include <string.h>
#include <string>
#include <vector>

/**
 * An encapsulated public key.
 *
 * Only the encoding is checked here (prefix byte and length). Curve point
 * validation belongs to signature verification, which is not part of this
 * code base.
 */
class CPubKey
{
public:
    static constexpr unsigned int PUBLIC_KEY_SIZE = 65;
    static constexpr unsigned int COMPRESSED_PUBLIC_KEY_SIZE = 33;

private:
    /**
     * Just store the serialized data.
     * Its length can very cheaply be computed from the first byte.
     */
    unsigned char vch[PUBLIC_KEY_SIZE];

    //! Compute the length of a pubkey with a given first byte.
    unsigned int static GetLen(unsigned char chHeader)
    {
        if (chHeader == 2 || chHeader == 3)
            return COMPRESSED_PUBLIC_KEY_SIZE;
        if (chHeader == 4 || chHeader == 6 || chHeader == 7)
            return PUBLIC_KEY_SIZE;
        return 0;
    }

    //! Set this key data to be invalid
    void Invalidate()
    {
        vch[0] = 0xFF;
    }

public:
    //! Construct an invalid public key.
    CPubKey()
    {
        Invalidate();
    }

    //! Initialize a public key using begin/end iterators to byte data.
    template <typename T>
    void Set(const T pbegin, const T pend)
    {
        int len = pend == pbegin ? 0 : GetLen(pbegin[0]);
        if (len && len == (pend - pbegin))
            memcpy(vch, (unsigned char*)&pbegin[0], len);
        else
            Invalidate();
    }

    //! Construct a public key using begin/end iterators to byte data.
    template <typename T>
    CPubKey(const T pbegin, const T pend)
    {
        Set(pbegin, pend);
    }

    //! Construct a public key from a byte vector.
    explicit CPubKey(const std::vector<unsigned char>& _vch)
    {
        Set(_vch.begin(), _vch.end());
    }

    //! Simple read-only vector-like interface to the pubkey data.
    unsigned int size() const { return GetLen(vch[0]); }
    const unsigned char* data() const { return vch; }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + size(); }
    const unsigned char& operator[](unsigned int pos) const { return vch[pos]; }

    //! Comparator implementation.
    friend bool operator==(const CPubKey& a, const CPubKey& b)
    {
        return a.vch[0] == b.vch[0] &&
               memcmp(a.vch, b.vch, a.size()) == 0;
    }
    friend bool operator!=(const CPubKey& a, const CPubKey& b)
    {
        return !(a == b);
    }
    friend bool operator<(const CPubKey& a, const CPubKey& b)
    {
        return a.vch[0] < b.vch[0] ||
               (a.vch[0] == b.vch[0] && memcmp(a.vch, b.vch, a.size()) < 0);
    }

    //! Implement serialization, as if this was a byte vector.
    template <typename Stream>
    void Serialize(Stream& s) const
    {
        unsigned int len = size();
        ::WriteCompactSize(s, len);
        s.write((char*)vch, len);
    }
    template <typename Stream>
    void Unserialize(Stream& s)
    {
        unsigned int len = ::ReadCompactSize(s);
        if (len <= PUBLIC_KEY_SIZE) {
            s.read((char*)vch, len);
            if (len != size()) {
                Invalidate();
            }
        } else {
            // invalid pubkey, skip available data
            char dummy;
            while (len--)
                s.read(&dummy, 1);
            Invalidate();
        }
    }

    //! Get the 160-bit hash of this public key (first 20 bytes of its double SHA-256).
    uint160 GetHash160() const;

    /*
     * Check syntactic correctness.
     *
     * Note that this is consensus critical as CheckSig() calls it!
     */
    bool IsValid() const
    {
        return size() > 0;
    }

    //! Check whether this is a compressed public key.
    bool IsCompressed() const
    {
        return size() == COMPRESSED_PUBLIC_KEY_SIZE;
    }

    std::vector<unsigned char> Raw() const
    {
        return std::vector<unsigned char>(begin(), end());
    }

    std::string GetHex() const;
};

/**
 * A 4-byte key handle. Authorization scripts reference keys registered by
 * the provisioning thread through these handles instead of key hashes.
 * Encoded little-endian wherever it is pushed or embedded.
 */
class KeyID
{
private:
    uint32_t nID;

public:
    static constexpr unsigned int SIZE = 4;

    KeyID() : nID(0) {}
    explicit KeyID(uint32_t nIDIn) : nID(nIDIn) {}

    static KeyID FromBytes(const std::vector<unsigned char>& vch)
    {
        if (vch.size() != SIZE)
            throw std::invalid_argument("KeyID::FromBytes: expected 4 bytes");
        return KeyID(ReadLE32(vch.data()));
    }

    std::vector<unsigned char> ToBytes() const
    {
        std::vector<unsigned char> vch(SIZE);
        WriteLE32(vch.data(), nID);
        return vch;
    }

    uint32_t GetUint32() const { return nID; }
    std::string ToString() const;

    friend bool operator==(const KeyID& a, const KeyID& b) { return a.nID == b.nID; }
    friend bool operator!=(const KeyID& a, const KeyID& b) { return a.nID != b.nID; }
    friend bool operator<(const KeyID& a, const KeyID& b) { return a.nID < b.nID; }

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, nID);
    }
    template <typename Stream>
    void Unserialize(Stream& s)
    {
        ::Unserialize(s, nID);
    }
};

#endif // GOVCHAIN_PUBKEY_H
