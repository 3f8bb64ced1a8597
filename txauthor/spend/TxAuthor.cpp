/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "TxAuthor.hpp"
#include "Outputs.hpp"

namespace txauthor {

TxAuthor::TxAuthor(ChangeSource &changeSource, const NetworkParams &network):
    changeSource_(changeSource),
    network_(network),
    feeRatePerKb_(network.relayFeePerKb),
    account_(0),
    random_(randomIndex)
{
}

Status
TxAuthor::inputAdd(const SelectedInput &input)
{
    inputs_.push_back(input);
    return Status();
}

Status
TxAuthor::destinationAdd(const std::string &address, int64_t amount)
{
    TransactionDestination destination;
    destination.address = address;
    destination.amount = amount;
    destinations_.push_back(destination);
    return Status();
}

Status
TxAuthor::destinationAddMax(const std::string &address)
{
    TransactionDestination destination;
    destination.address = address;
    destination.sendMax = true;
    destinations_.push_back(destination);
    return Status();
}

Status
TxAuthor::changeAdd(const std::string &address, int64_t amount)
{
    TransactionDestination destination;
    destination.address = address;
    destination.amount = amount;
    change_.push_back(destination);
    return Status();
}

Status
TxAuthor::feeRateSet(int64_t feeRatePerKb)
{
    if (feeRatePerKb < 0)
        return TXA_ERROR(TXA_CC_InvalidAmount, "Negative fee rate");
    feeRatePerKb_ = feeRatePerKb;
    return Status();
}

Status
TxAuthor::accountSet(uint32_t account)
{
    account_ = account;
    return Status();
}

Status
TxAuthor::randomSet(const RandomIndex &random)
{
    if (!random)
        return TXA_ERROR(TXA_CC_NULLPtr, "No random source");
    random_ = random;
    return Status();
}

Status
TxAuthor::calculateFees(uint64_t &totalFees)
{
    AuthoredTx authored;
    TXA_CHECK(makeTx(authored));

    totalFees = authored.fee();
    return Status();
}

Status
TxAuthor::calculateMax(uint64_t &maxAmount)
{
    bool hasMax = false;
    int64_t totalSend = 0;
    for (const auto &destination: destinations_)
    {
        if (destination.sendMax)
            hasMax = true;
        else
            totalSend += destination.amount;
    }
    if (!hasMax)
        return TXA_ERROR(TXA_CC_Error, "No destination receives the maximum amount");

    AuthoredTx authored;
    TXA_CHECK(makeTx(authored));

    // Whatever the fixed outputs don't account for went to the max output,
    // unless it was dust and got dropped:
    maxAmount = outputsTotal(authored.tx.outputs) - totalSend;
    return Status();
}

Status
TxAuthor::makeTx(AuthoredTx &result)
{
    return authorTx(result, inputs_, destinations_, change_, account_,
                    changeSource_, network_, feeRatePerKb_, random_);
}

} // namespace txauthor
